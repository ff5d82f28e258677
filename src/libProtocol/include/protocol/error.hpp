#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tc::protocol {

enum class ErrorKind {
	MalformedMessage,      //!< Datagram size or shape violates the wire format.
	InvalidIdentifier,     //!< Name is not 1 to 16 letters, digits and spaces.
	InvalidHeaderValue,    //!< Header field does not fit its byte width.
	InvalidBody,           //!< Body is empty or larger than the segment allows.
	InvalidNetworkId,      //!< Network ID does not resolve to a user.
	InvalidTeamId,         //!< Team ID out of range and not the wildcard.
	InvalidStatus,         //!< Status out of range and not the inactive sigil.
	CapacityExceeded,      //!< User limit reached.
	UnknownMessageType,    //!< Type byte not part of the protocol.
	UnexpectedMessageType, //!< Typed field read from a message of another type.
	InvalidConfiguration,  //!< Server or client set up with unusable values.
	RequestTimeout,        //!< Client gave up after its retry cap.
};

std::string_view toString(ErrorKind kind);

//! Domain error raised by the codec, the directory and the client session.
//! what() is the reason string that is sent back in Error replies.
class ProtocolError : public std::runtime_error {
public:
	ProtocolError(ErrorKind kind, const std::string& reason);

	ErrorKind kind() const; //!< Category of the failure.

private:
	ErrorKind m_kind;
};

} // namespace tc::protocol
