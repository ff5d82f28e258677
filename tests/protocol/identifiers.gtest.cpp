#include "protocol/error.hpp"
#include "protocol/identifiers.hpp"

#include <gtest/gtest.h>

#include <random>
#include <set>
#include <string>
#include <vector>

namespace tc::gtest {

using namespace protocol;

TEST(Identifiers, Validity) {
	EXPECT_TRUE(isValidIdentifier("Alice"));
	EXPECT_TRUE(isValidIdentifier("The A Team"));
	EXPECT_TRUE(isValidIdentifier("0123456789abcdef"));

	EXPECT_FALSE(isValidIdentifier(""));
	EXPECT_FALSE(isValidIdentifier("0123456789abcdefg"));
	EXPECT_FALSE(isValidIdentifier("Al!ce"));
	EXPECT_FALSE(isValidIdentifier("#TEAMS"));
	EXPECT_FALSE(isValidIdentifier("tab\there"));
}

TEST(Identifiers, ValidityOfRandomStrings) {
	static const std::string allowed = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789 ";
	static const std::string other   = std::string("#&!?.,;:-_/\\\t\n@~") + '\0' + "\x7f\xc3\xa9";

	std::mt19937 rng(2024u);
	for (int i = 0; i < 5000; ++i) {
		const auto length = rng() % 21u;

		std::string candidate;
		for (unsigned c = 0; c < length; ++c) {
			// Mostly allowed characters so valid candidates are common.
			const auto& pool = rng() % 10u == 0u ? other : allowed;
			candidate.push_back(pool[rng() % pool.size()]);
		}

		bool expected = !candidate.empty() && candidate.size() <= MAX_IDENTIFIER_SIZE;
		for (const char c: candidate) {
			expected = expected && allowed.find(c) != std::string::npos;
		}
		EXPECT_EQ(isValidIdentifier(candidate), expected) << "\"" << candidate << "\"";
	}
}

TEST(Identifiers, PackLayout) {
	const auto body = packIdentifierList({{"#USERS", {"Alice", ""}}}, false);

	ASSERT_EQ(body.size(), 3 * MAX_IDENTIFIER_SIZE);
	EXPECT_EQ(readSlot(body, 0), "#USERS");
	EXPECT_EQ(readSlot(body, MAX_IDENTIFIER_SIZE), "Alice");
	EXPECT_EQ(readSlot(body, 2 * MAX_IDENTIFIER_SIZE), "");

	// Zero padding up to the slot width
	for (std::size_t i = MAX_IDENTIFIER_SIZE + 5; i < 3 * MAX_IDENTIFIER_SIZE; ++i) {
		EXPECT_EQ(body[i], 0u);
	}
}

TEST(Identifiers, PackTerminated) {
	const auto body = packIdentifierList({{"#TEAMS", {"Red"}}, {"#STATUSES", {"Busy"}}}, true);
	ASSERT_EQ(body.size(), 4 * MAX_IDENTIFIER_SIZE + 1);
	EXPECT_EQ(body.back(), DESCRIPTION_END);
}

TEST(Identifiers, PackFullWidthEntry) {
	const auto body = packIdentifierList({{"#USERS", {"0123456789abcdef"}}}, false);
	EXPECT_EQ(readSlot(body, MAX_IDENTIFIER_SIZE), "0123456789abcdef");
}

TEST(Identifiers, PackRejectsInvalidInput) {
	try {
		packIdentifierList({{"#USERS", {"0123456789abcdefg"}}}, false);
		FAIL() << "Oversized identifier was packed";
	} catch (const ProtocolError& ex) {
		EXPECT_EQ(ex.kind(), ErrorKind::InvalidIdentifier);
	}

	EXPECT_THROW(packIdentifierList({{"USERS", {"Alice"}}}, false), ProtocolError);
	EXPECT_THROW(packIdentifierList({{"", {}}}, false), ProtocolError);
}

TEST(Identifiers, UnpackByDelimiter) {
	const auto body = packIdentifierList({{"#TEAMS", {"Red", "Blue"}}, {"#STATUSES", {"Busy", "Free", "Away"}}}, true);

	EXPECT_EQ(unpackIdentifiersByDelimiter(body, "#TEAMS"), (std::vector<std::string>{"Red", "Blue"}));
	EXPECT_EQ(unpackIdentifiersByDelimiter(body, "#STATUSES"), (std::vector<std::string>{"Busy", "Free", "Away"}));
}

TEST(Identifiers, UnpackMissingDelimiter) {
	const auto body = packIdentifierList({{"#TEAMS", {"Red"}}}, false);
	EXPECT_TRUE(unpackIdentifiersByDelimiter(body, "#USERS").empty());
	EXPECT_TRUE(unpackIdentifiersByDelimiter(Bytes{}, "#USERS").empty());
}

TEST(Identifiers, UnpackEmptyCategory) {
	const auto body = packIdentifierList({{"#TEAMS", {}}, {"#STATUSES", {"Busy"}}}, false);
	EXPECT_TRUE(unpackIdentifiersByDelimiter(body, "#TEAMS").empty());
	EXPECT_EQ(unpackIdentifiersByDelimiter(body, "#STATUSES"), (std::vector<std::string>{"Busy"}));
}

TEST(Identifiers, UnpackKeepsVacantSlots) {
	const auto body = packIdentifierList({{"#USERS", {"", "Bob", ""}}}, false);
	EXPECT_EQ(unpackIdentifiersByDelimiter(body, "#USERS"), (std::vector<std::string>{"", "Bob", ""}));
}

TEST(Identifiers, UnpackStopsAtPartialSlot) {
	auto body = packIdentifierList({{"#USERS", {"Alice"}}}, false);
	body.push_back('x');
	body.push_back('y');

	EXPECT_EQ(unpackIdentifiersByDelimiter(body, "#USERS"), (std::vector<std::string>{"Alice"}));
}

TEST(Identifiers, RandomCategoriesUnpackAsPacked) {
	static const std::string letters = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
	static const std::string chars   = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789 ";

	std::mt19937 rng(7u);
	const auto randomText = [&rng](const std::string& pool, std::size_t length) {
		std::string text;
		for (std::size_t i = 0; i < length; ++i) {
			text.push_back(pool[rng() % pool.size()]);
		}
		return text;
	};

	for (int i = 0; i < 500; ++i) {
		std::vector<IdentifierCategory> categories;
		std::set<std::string> delimiters;

		const auto categoryCount = 1u + rng() % 4u;
		while (categories.size() < categoryCount) {
			const auto delimiter = "#" + randomText(letters, 1u + rng() % (MAX_IDENTIFIER_SIZE - 1));
			if (!delimiters.insert(delimiter).second) {
				continue;
			}

			IdentifierCategory category{delimiter, {}};
			const auto count = rng() % 12u;
			for (unsigned n = 0; n < count; ++n) {
				// Some vacant entries
				category.identifiers.push_back(rng() % 5u == 0u ? std::string() : randomText(chars, 1u + rng() % MAX_IDENTIFIER_SIZE));
			}
			categories.push_back(std::move(category));
		}

		const bool terminate = rng() % 2u == 0u;
		const auto body      = packIdentifierList(categories, terminate);

		std::size_t slots = 0;
		for (const auto& category: categories) {
			slots += category.identifiers.size() + 1;
		}
		ASSERT_EQ(body.size(), slots * MAX_IDENTIFIER_SIZE + (terminate ? 1u : 0u));

		for (const auto& category: categories) {
			EXPECT_EQ(unpackIdentifiersByDelimiter(body, category.delimiter), category.identifiers) << "round " << i << " " << category.delimiter;
		}
		EXPECT_TRUE(unpackIdentifiersByDelimiter(body, "#MISSING 1").empty());
	}
}

} // namespace tc::gtest
