// src/cli/cli_interface.cpp
#include "igknight/cli/cli_interface.h"
#include "igknight/cli/command_parser.h"
#include "igknight/core/exceptions.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace igknight {
namespace cli {

CLIInterface::CLIInterface(const api::GameApiConfig& config)
    : notation_(service_), api_(config) {

    // Set default callbacks
    outputCallback_ = [](const std::string& message) {
        std::cout << message << std::endl;
    };

    inputCallback_ = []() {
        std::cout << "> " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) {
            return std::string("quit");
        }
        return line;
    };

    registerCommands();
}

int CLIInterface::run() {
    output("IgKnight chess rules engine");
    output("===========================");
    output("Type 'help' for a list of commands.");

    while (running_) {
        std::string line = input();

        std::vector<std::string> tokens = CommandParser::tokenize(line);
        if (tokens.empty()) {
            continue;
        }

        std::string command = tokens[0];
        std::transform(command.begin(), command.end(), command.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (commands_.find(command) == commands_.end()) {
            output("Unknown command: " + tokens[0]);
            output("Type 'help' for a list of commands.");
            continue;
        }

        executeLine(line);
    }

    return 0;
}

bool CLIInterface::executeLine(const std::string& line) {
    std::vector<std::string> tokens = CommandParser::tokenize(line);
    if (tokens.empty()) {
        return false;
    }

    std::string command = tokens[0];
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::vector<std::string> args;
    if (rawCommands_.count(command) > 0) {
        std::string rest = CommandParser::remainder(line);
        if (!rest.empty()) {
            args.push_back(rest);
        }
    } else {
        args.assign(tokens.begin() + 1, tokens.end());
    }

    return executeCommand(command, args);
}

bool CLIInterface::executeCommand(const std::string& command, const std::vector<std::string>& args) {
    std::string lcCommand = command;
    std::transform(lcCommand.begin(), lcCommand.end(), lcCommand.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = commands_.find(lcCommand);
    if (it == commands_.end()) {
        return false;
    }

    try {
        return it->second(args);
    } catch (const core::EngineException& e) {
        output("Error: " + std::string(e.what()));
        return false;
    }
}

void CLIInterface::setOutputCallback(std::function<void(const std::string&)> callback) {
    if (callback) {
        outputCallback_ = callback;
    }
}

void CLIInterface::setInputCallback(std::function<std::string()> callback) {
    if (callback) {
        inputCallback_ = callback;
    }
}

void CLIInterface::registerCommands() {
    commands_["help"] = [this](const std::vector<std::string>& args) {
        return cmdHelp(args);
    };
    commandHelp_["help"] = "Display help information. Usage: help [command]";

    commands_["new"] = [this](const std::vector<std::string>& args) {
        return cmdNew(args);
    };
    commandHelp_["new"] = "Start a new game from the standard position. Usage: new";

    commands_["fen"] = [this](const std::vector<std::string>& args) {
        return cmdFen(args);
    };
    commandHelp_["fen"] = "Load a position, or print the current one. Usage: fen [FEN]";

    commands_["show"] = [this](const std::vector<std::string>& args) {
        return cmdShow(args);
    };
    commandHelp_["show"] = "Show the current board. Usage: show";

    commands_["moves"] = [this](const std::vector<std::string>& args) {
        return cmdMoves(args);
    };
    commandHelp_["moves"] = "List legal moves. Usage: moves [square]";

    commands_["play"] = [this](const std::vector<std::string>& args) {
        return cmdPlay(args);
    };
    commandHelp_["play"] = "Make a move. Usage: play <e2e4|Nf3|O-O>";

    commands_["undo"] = [this](const std::vector<std::string>& args) {
        return cmdUndo(args);
    };
    commandHelp_["undo"] = "Take back the last move. Usage: undo";

    commands_["status"] = [this](const std::vector<std::string>& args) {
        return cmdStatus(args);
    };
    commandHelp_["status"] = "Show the game status. Usage: status";

    commands_["request"] = [this](const std::vector<std::string>& args) {
        return cmdRequest(args);
    };
    commandHelp_["request"] = "Send a JSON request to the request handler. Usage: request <json>";

    commands_["quit"] = [this](const std::vector<std::string>& args) {
        return cmdQuit(args);
    };
    commandHelp_["quit"] = "Quit the program. Usage: quit";
    commands_["exit"] = commands_["quit"];
    commandHelp_["exit"] = commandHelp_["quit"];

    rawCommands_ = {"fen", "request"};
}

void CLIInterface::output(const std::string& message) {
    outputCallback_(message);
}

std::string CLIInterface::input() {
    return inputCallback_();
}

bool CLIInterface::cmdHelp(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Available commands:");
        // std::map keeps the names sorted
        for (const auto& entry : commandHelp_) {
            output("  " + entry.first + " - " + entry.second);
        }
        return true;
    }

    auto it = commandHelp_.find(args[0]);
    if (it == commandHelp_.end()) {
        output("Unknown command: " + args[0]);
        return false;
    }
    output(it->second);
    return true;
}

bool CLIInterface::cmdNew(const std::vector<std::string>& /*args*/) {
    board_ = chess::Board();
    undoStack_.clear();
    output("New game started");
    return cmdShow({});
}

bool CLIInterface::cmdFen(const std::vector<std::string>& args) {
    if (args.empty()) {
        output(board_.toFEN());
        return true;
    }

    // Throws FormatError on a bad FEN, leaving the current board untouched
    chess::Board loaded = chess::Board::fromFEN(args[0]);
    board_ = loaded;
    undoStack_.clear();
    output("Position loaded");
    return cmdShow({});
}

bool CLIInterface::cmdShow(const std::vector<std::string>& /*args*/) {
    output(board_.toString());
    output("FEN: " + board_.toFEN());
    output("To move: " + chess::colorToString(board_.getCurrentTurn()));
    return true;
}

bool CLIInterface::cmdMoves(const std::vector<std::string>& args) {
    const chess::MoveValidator& validator = service_.getValidator();

    std::vector<chess::Move> moves;
    if (args.empty()) {
        moves = validator.generateLegalMoves(board_, board_.getCurrentTurn());
    } else {
        moves = validator.generateLegalMovesForPiece(board_, chess::Position::fromAlgebraic(args[0]));
    }

    if (moves.empty()) {
        output("No legal moves");
        return true;
    }

    std::ostringstream ss;
    ss << moves.size() << " legal moves:";
    for (const auto& move : moves) {
        ss << " " << notation_.toSAN(board_, move);
    }
    output(ss.str());
    return true;
}

bool CLIInterface::cmdPlay(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Missing move. Usage: play <move>");
        return false;
    }

    chess::GameStatus status = service_.determineGameStatus(board_);
    if (chess::isTerminalStatus(status)) {
        output("Game is over: " + chess::gameStatusToString(status));
        return false;
    }

    const chess::MoveValidator& validator = service_.getValidator();
    chess::Move requested = notation_.parseMove(board_, args[0]);
    std::optional<chess::Move> resolved = validator.resolveMove(board_, requested);
    if (!resolved) {
        output("Illegal move: " + args[0]);
        return false;
    }

    std::string san = notation_.toSAN(board_, *resolved);
    undoStack_.push_back(board_);
    validator.executeMove(board_, *resolved);
    output("Played " + san + " (" + resolved->toAlgebraic() + ")");

    status = service_.determineGameStatus(board_);
    if (chess::isTerminalStatus(status)) {
        output("Game over: " + chess::gameStatusToString(status));
    }
    return true;
}

bool CLIInterface::cmdUndo(const std::vector<std::string>& /*args*/) {
    if (undoStack_.empty()) {
        output("Cannot undo move: no moves to undo");
        return false;
    }

    board_ = undoStack_.back();
    undoStack_.pop_back();
    output("Move undone");
    return cmdShow({});
}

bool CLIInterface::cmdStatus(const std::vector<std::string>& /*args*/) {
    chess::GameSnapshot snapshot = service_.getSnapshot(board_);

    output("Status: " + chess::gameStatusToString(snapshot.status));
    output("To move: " + chess::colorToString(snapshot.currentTurn) +
           (snapshot.isCheck ? " (in check)" : ""));
    output("Legal moves: " + std::to_string(snapshot.legalMovesCount));
    output("Half-move clock: " + std::to_string(snapshot.halfMoveClock) +
           ", full move: " + std::to_string(snapshot.fullMoveNumber));
    return true;
}

bool CLIInterface::cmdRequest(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Missing request body. Usage: request <json>");
        return false;
    }

    output(api_.handleRequest(args[0]));
    return true;
}

bool CLIInterface::cmdQuit(const std::vector<std::string>& /*args*/) {
    running_ = false;
    return true;
}

} // namespace cli
} // namespace igknight
