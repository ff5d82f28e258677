#pragma once

#include "protocol/protocol.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tc::protocol {

//! True if the identifier has 1 to 16 characters, each a letter, digit or space.
bool isValidIdentifier(std::string_view identifier);

//! One named sub-list of a padded identifier list.
struct IdentifierCategory {
	std::string delimiter;                //!< Marker starting with '#', e.g. "#TEAMS".
	std::vector<std::string> identifiers; //!< Entries, empty strings encode vacant slots.
};

//! Pack categories into 16 byte zero padded slots, each category preceded by its delimiter slot.
//! \param terminate Append the single '#' byte that ends a multi-category description.
//! \note Throws ProtocolError(InvalidIdentifier) for entries wider than a slot or delimiters without '#'.
Bytes packIdentifierList(const std::vector<IdentifierCategory>& categories, bool terminate);

//! Collect the identifiers following the slot equal to delimiter, up to the next delimiter slot
//! or the end of the body. A trailing partial slot ends the scan.
//! Returns an empty list if the delimiter is absent.
std::vector<std::string> unpackIdentifiersByDelimiter(const Bytes& body, std::string_view delimiter);

//! Slot content with the zero padding removed.
std::string readSlot(const Bytes& body, std::size_t offset);

} // namespace tc::protocol
