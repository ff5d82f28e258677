#include "protocol/identifiers.hpp"

#include "protocol/error.hpp"

#include <algorithm>

namespace tc::protocol {

static bool isIdentifierChar(char c) {
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == ' ';
}

bool isValidIdentifier(std::string_view identifier) {
	if (identifier.empty() || identifier.size() > MAX_IDENTIFIER_SIZE) {
		return false;
	}
	return std::all_of(identifier.begin(), identifier.end(), isIdentifierChar);
}

static void appendSlot(Bytes& out, std::string_view entry) {
	if (entry.size() > MAX_IDENTIFIER_SIZE) {
		throw ProtocolError(ErrorKind::InvalidIdentifier, "Identifier \"" + std::string(entry) + "\" does not fit a slot");
	}

	out.insert(out.end(), entry.begin(), entry.end());
	out.insert(out.end(), MAX_IDENTIFIER_SIZE - entry.size(), 0u);
}

Bytes packIdentifierList(const std::vector<IdentifierCategory>& categories, bool terminate) {
	std::size_t slotCount = 0;
	for (const auto& category: categories) {
		slotCount += category.identifiers.size() + 1;
	}

	Bytes out;
	out.reserve(slotCount * MAX_IDENTIFIER_SIZE + (terminate ? 1 : 0));

	for (const auto& category: categories) {
		if (category.delimiter.empty() || category.delimiter.front() != DELIMITER_PREFIX) {
			throw ProtocolError(ErrorKind::InvalidIdentifier, "Delimiter \"" + category.delimiter + "\" must start with '#'");
		}
		appendSlot(out, category.delimiter);
		for (const auto& identifier: category.identifiers) {
			appendSlot(out, identifier);
		}
	}

	if (terminate) {
		out.push_back(DESCRIPTION_END);
	}
	return out;
}

std::string readSlot(const Bytes& body, std::size_t offset) {
	if (offset >= body.size()) {
		return {};
	}

	const auto begin = body.begin() + static_cast<std::ptrdiff_t>(offset);
	const auto end   = body.begin() + static_cast<std::ptrdiff_t>(std::min(offset + MAX_IDENTIFIER_SIZE, body.size()));

	// Trim trailing zero padding only. Embedded bytes stay as they are.
	auto last = end;
	while (last != begin && *(last - 1) == 0u) {
		--last;
	}
	return std::string(begin, last);
}

std::vector<std::string> unpackIdentifiersByDelimiter(const Bytes& body, std::string_view delimiter) {
	std::size_t offset = 0;

	// Skip to the slot after the delimiter.
	bool found = false;
	for (; offset + MAX_IDENTIFIER_SIZE <= body.size(); offset += MAX_IDENTIFIER_SIZE) {
		if (readSlot(body, offset) == delimiter) {
			offset += MAX_IDENTIFIER_SIZE;
			found = true;
			break;
		}
	}
	if (!found) {
		return {};
	}

	std::vector<std::string> identifiers;
	for (; offset + MAX_IDENTIFIER_SIZE <= body.size(); offset += MAX_IDENTIFIER_SIZE) {
		auto slot = readSlot(body, offset);
		if (!slot.empty() && slot.front() == DELIMITER_PREFIX) {
			break;
		}
		identifiers.push_back(std::move(slot));
	}
	return identifiers;
}

} // namespace tc::protocol
