#include "clientMenu.hpp"

#include "protocol/error.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace tc::app {

namespace {

std::string nameOrNone(const std::vector<std::string>& names, unsigned index) {
	return index < names.size() ? names[index] : "[none]";
}

} // namespace

ClientMenu::ClientMenu(teamNet::ClientSession& session, std::istream& input, std::ostream& output)
    : m_session(session), m_input(input), m_output(output) {
}

void ClientMenu::run() {
	while (m_input) {
		displayMenu();

		switch (readChoice()) {
		case 1:
			updateStatus();
			break;
		case 2:
			changeTeam();
			break;
		case 3:
			displayTeamStatus();
			break;
		case 4:
			quit();
			return;
		default:
			if (m_input) {
				m_output << "Invalid input.\n";
			}
			break;
		}
	}
	quit();
}

void ClientMenu::displayMenu() const {
	const auto& config = m_session.config();

	m_output << "\n===========================================================\n";
	m_output << "SERVER: " << std::left << std::setw(20) << (config.host + ":" + std::to_string(config.port)) << " |\n";
	m_output << "USER:   " << std::setw(20) << m_session.displayName() << " | NET_ID: " << m_session.networkId() << "\n";
	m_output << "TEAM:   " << std::setw(20) << nameOrNone(m_session.teamNames(), m_session.teamId())
	         << " | STATUS: " << nameOrNone(m_session.statusNames(), m_session.status()) << "\n\n";
	m_output << std::right;

	m_output << "Type a number to choose an option:\n";
	m_output << "  [1] Update my status\n";
	m_output << "  [2] Change my team\n";
	m_output << "  [3] Get team status update\n";
	m_output << "  [4] Quit program\n\n";
}

void ClientMenu::updateStatus() {
	const auto& statuses = m_session.statusNames();

	m_output << "Type a number to choose a status\n";
	for (std::size_t i = 0; i < statuses.size(); ++i) {
		m_output << "  [" << (i + 1) << "] " << statuses[i] << "\n";
	}

	const auto choice = readChoice();
	if (choice < 1 || static_cast<std::size_t>(choice) > statuses.size()) {
		m_output << "Invalid selection: " << choice << "\n";
		return;
	}
	m_session.updateStatus(static_cast<directory::StatusId>(choice - 1));
}

void ClientMenu::changeTeam() {
	const auto& teams = m_session.teamNames();

	m_output << "Type a number to choose a team\n";
	for (std::size_t i = 0; i < teams.size(); ++i) {
		m_output << "  [" << (i + 1) << "] " << teams[i] << "\n";
	}

	const auto choice = readChoice();
	if (choice < 1 || static_cast<std::size_t>(choice) > teams.size()) {
		m_output << "Invalid selection: " << choice << "\n";
		return;
	}
	m_session.changeTeam(static_cast<directory::TeamId>(choice - 1));
}

void ClientMenu::displayTeamStatus() {
	try {
		for (const auto& member : m_session.teamStatus()) {
			m_output << "  " << std::left << std::setw(16) << member.name << std::right << " - " << nameOrNone(m_session.statusNames(), member.status)
			         << "\n";
		}
	} catch (const protocol::ProtocolError& ex) {
		m_output << ex.what() << "\n";
	}
}

void ClientMenu::quit() {
	m_output << "Shutting down TeamConnect client...\n";
	m_session.leave();
	m_output << "Shutdown complete. Goodbye.\n";
}

int ClientMenu::readChoice() {
	std::string line;
	if (!std::getline(m_input, line)) {
		return -1;
	}

	try {
		return std::stoi(line);
	} catch (const std::exception&) {
		return -1;
	}
}

} // namespace tc::app
