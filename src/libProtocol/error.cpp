#include "protocol/error.hpp"

namespace tc::protocol {

ProtocolError::ProtocolError(ErrorKind kind, const std::string& reason) : std::runtime_error(reason), m_kind(kind) {
}

ErrorKind ProtocolError::kind() const {
	return m_kind;
}

std::string_view toString(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::MalformedMessage:
		return "MalformedMessage";
	case ErrorKind::InvalidIdentifier:
		return "InvalidIdentifier";
	case ErrorKind::InvalidHeaderValue:
		return "InvalidHeaderValue";
	case ErrorKind::InvalidBody:
		return "InvalidBody";
	case ErrorKind::InvalidNetworkId:
		return "InvalidNetworkId";
	case ErrorKind::InvalidTeamId:
		return "InvalidTeamId";
	case ErrorKind::InvalidStatus:
		return "InvalidStatus";
	case ErrorKind::CapacityExceeded:
		return "CapacityExceeded";
	case ErrorKind::UnknownMessageType:
		return "UnknownMessageType";
	case ErrorKind::UnexpectedMessageType:
		return "UnexpectedMessageType";
	case ErrorKind::InvalidConfiguration:
		return "InvalidConfiguration";
	case ErrorKind::RequestTimeout:
		return "RequestTimeout";
	}
	return "Unknown";
}

} // namespace tc::protocol
