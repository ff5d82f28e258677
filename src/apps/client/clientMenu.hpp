#pragma once

#include "teamNet/clientSession.hpp"

#include <iosfwd>

namespace tc::app {

//! Interactive text menu on top of a registered client session.
class ClientMenu {
public:
	ClientMenu(teamNet::ClientSession& session, std::istream& input, std::ostream& output);

	void run(); //!< Loops until the user quits or input closes. Always leaves the team on exit.

private:
	void displayMenu() const;
	void updateStatus();
	void changeTeam();
	void displayTeamStatus();
	void quit();

	//! Reads a 1-based menu choice. Returns -1 on invalid input.
	int readChoice();

private:
	teamNet::ClientSession& m_session;
	std::istream& m_input;
	std::ostream& m_output;
};

} // namespace tc::app
