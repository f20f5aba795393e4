// src/api/game_api.cpp
#include "igknight/api/game_api.h"
#include "igknight/core/exceptions.h"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace igknight {
namespace api {

GameApiConfig GameApiConfig::fromJson(const nlohmann::json& j) {
    GameApiConfig config;
    config.includeLegalMoves = j.value("include_legal_moves", config.includeLegalMoves);
    config.includeDiagram = j.value("include_diagram", config.includeDiagram);
    config.verbose = j.value("verbose", config.verbose);
    return config;
}

GameApi::GameApi(const GameApiConfig& config)
    : config_(config), notation_(service_) {
    registerRoutes();
}

void GameApi::registerRoutes() {
    routes_["legal_moves"] = [this](const nlohmann::json& request) {
        return handleLegalMoves(request);
    };

    routes_["move"] = [this](const nlohmann::json& request) {
        return handleMove(request);
    };

    routes_["status"] = [this](const nlohmann::json& request) {
        return handleStatus(request);
    };
}

std::string GameApi::handleRequest(const std::string& body) {
    nlohmann::json requestJson;
    try {
        requestJson = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        if (config_.verbose) {
            std::cerr << "Error parsing request: " << e.what() << std::endl;
        }
        return errorResponse("malformed_request", e.what()).dump();
    }

    return handleJson(requestJson).dump();
}

nlohmann::json GameApi::handleJson(const nlohmann::json& request) {
    try {
        if (!request.is_object()) {
            return errorResponse("malformed_request", "Request must be a JSON object");
        }

        std::string action = request.at("action").get<std::string>();
        auto it = routes_.find(action);
        if (it == routes_.end()) {
            return errorResponse("unknown_action", "Unknown action: " + action);
        }

        return it->second(request);
    } catch (const nlohmann::json::exception& e) {
        if (config_.verbose) {
            std::cerr << "Error reading request: " << e.what() << std::endl;
        }
        return errorResponse("malformed_request", e.what());
    } catch (const core::FormatError& e) {
        if (config_.verbose) {
            std::cerr << "Error decoding request: " << e.what() << std::endl;
        }
        return errorResponse("malformed_request", e.what());
    } catch (const core::IllegalMoveError& e) {
        if (config_.verbose) {
            std::cerr << "Rejected move " << e.getMove() << ": " << e.what() << std::endl;
        }
        nlohmann::json response = errorResponse("illegal_move", e.what());
        response["accepted"] = false;
        response["move"] = e.getMove();
        return response;
    } catch (const core::CorruptStateError& e) {
        std::cerr << "Error evaluating position: " << e.what() << std::endl;
        return errorResponse("corrupt_state", e.what());
    }
}

chess::Board GameApi::loadBoard(const nlohmann::json& request) const {
    chess::Board board = chess::Board::fromFEN(request.at("fen").get<std::string>());
    if (request.contains("history")) {
        board.setPositionHistory(request.at("history").get<std::vector<std::string>>());
    }
    return board;
}

chess::Move GameApi::readMove(const chess::Board& board, const nlohmann::json& request) const {
    if (request.contains("move")) {
        return notation_.parseMove(board, request.at("move").get<std::string>());
    }

    std::string label = request.at("from").get<std::string>() + request.at("to").get<std::string>();
    if (request.contains("promotion")) {
        std::string promotion = request.at("promotion").get<std::string>();
        if (promotion.length() != 1) {
            throw core::FormatError("Invalid promotion piece: " + promotion);
        }
        label += static_cast<char>(std::tolower(static_cast<unsigned char>(promotion[0])));
    }
    return chess::Move::fromAlgebraic(label);
}

void GameApi::describeBoard(const chess::Board& board, nlohmann::json& response) const {
    chess::GameSnapshot snapshot = service_.getSnapshot(board);

    response["fen"] = snapshot.fen;
    response["turn"] = chess::colorToString(snapshot.currentTurn);
    response["status"] = chess::gameStatusToString(snapshot.status);
    response["is_terminal"] = chess::isTerminalStatus(snapshot.status);
    response["is_check"] = snapshot.isCheck;
    response["is_checkmate"] = snapshot.status == chess::GameStatus::CHECKMATE;
    response["legal_moves_count"] = snapshot.legalMovesCount;
    response["halfmove_clock"] = snapshot.halfMoveClock;
    response["fullmove_number"] = snapshot.fullMoveNumber;

    if (config_.includeLegalMoves) {
        nlohmann::json moves = nlohmann::json::array();
        for (const auto& move : service_.getValidator().generateLegalMoves(board, board.getCurrentTurn())) {
            moves.push_back(move.toAlgebraic());
        }
        response["legal_moves"] = moves;
    }

    if (config_.includeDiagram) {
        response["diagram"] = board.toString();
    }
}

nlohmann::json GameApi::handleLegalMoves(const nlohmann::json& request) {
    chess::Board board = loadBoard(request);
    const chess::MoveValidator& validator = service_.getValidator();

    nlohmann::json response;
    std::vector<chess::Move> moves;
    if (request.contains("square")) {
        chess::Position square = chess::Position::fromAlgebraic(request.at("square").get<std::string>());
        moves = validator.generateLegalMovesForPiece(board, square);
        response["square"] = square.toAlgebraic();

        // Promotions repeat a destination four times
        nlohmann::json destinations = nlohmann::json::array();
        for (const auto& move : moves) {
            std::string target = move.to.toAlgebraic();
            if (std::find(destinations.begin(), destinations.end(), target) == destinations.end()) {
                destinations.push_back(target);
            }
        }
        response["destinations"] = destinations;
    } else {
        moves = validator.generateLegalMoves(board, board.getCurrentTurn());
    }

    nlohmann::json labels = nlohmann::json::array();
    nlohmann::json sans = nlohmann::json::array();
    for (const auto& move : moves) {
        labels.push_back(move.toAlgebraic());
        sans.push_back(notation_.toSAN(board, move));
    }
    response["moves"] = labels;
    response["san"] = sans;
    response["count"] = moves.size();
    return response;
}

nlohmann::json GameApi::handleMove(const nlohmann::json& request) {
    chess::Board board = loadBoard(request);
    chess::Move requested = readMove(board, request);

    const chess::MoveValidator& validator = service_.getValidator();
    std::optional<chess::Move> resolved = validator.resolveMove(board, requested);
    if (!resolved) {
        throw core::IllegalMoveError("Illegal move: " + requested.toAlgebraic(), requested.toAlgebraic());
    }

    std::string san = notation_.toSAN(board, *resolved);
    validator.executeMove(board, *resolved);

    nlohmann::json response;
    response["accepted"] = true;
    response["move"] = resolved->toAlgebraic();
    response["san"] = san;
    describeBoard(board, response);
    response["history"] = board.getPositionHistory();
    return response;
}

nlohmann::json GameApi::handleStatus(const nlohmann::json& request) {
    chess::Board board = loadBoard(request);

    nlohmann::json response;
    describeBoard(board, response);
    return response;
}

nlohmann::json GameApi::errorResponse(const std::string& code, const std::string& message) const {
    return {
        {"error", code},
        {"message", message}
    };
}

} // namespace api
} // namespace igknight
