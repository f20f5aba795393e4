// include/igknight/api/game_api.h
#ifndef IGKNIGHT_API_GAME_API_H
#define IGKNIGHT_API_GAME_API_H

#include <string>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include "igknight/chess/board.h"
#include "igknight/chess/game_state_service.h"
#include "igknight/chess/notation.h"

namespace igknight {
namespace api {

/**
 * @brief Options for the JSON request handler
 */
struct GameApiConfig {
    // Attach the full legal move list to move/status responses
    bool includeLegalMoves = false;

    // Attach a text diagram of the board to move/status responses
    bool includeDiagram = false;

    // Log failed requests to stderr
    bool verbose = false;

    /**
     * @brief Read options from a JSON object
     *
     * Recognized keys: "include_legal_moves", "include_diagram", "verbose".
     * Missing keys keep their defaults.
     */
    static GameApiConfig fromJson(const nlohmann::json& j);
};

/**
 * @brief Stateless JSON request handler for the rules engine
 *
 * Every request carries the position as FEN (plus an optional placement
 * history), so the caller owns all game state. Requests are objects with an
 * "action" of "legal_moves", "move" or "status".
 */
class GameApi {
public:
    /**
     * @brief Constructor
     *
     * @param config Handler options
     */
    explicit GameApi(const GameApiConfig& config = GameApiConfig());

    /**
     * @brief Handle a request body
     *
     * @param body Request body (JSON)
     * @return Response (JSON string). Errors are reported in the response,
     *         never thrown.
     */
    std::string handleRequest(const std::string& body);

    /**
     * @brief Handle an already parsed request
     */
    nlohmann::json handleJson(const nlohmann::json& request);

    const GameApiConfig& getConfig() const { return config_; }

private:
    using RouteHandler = std::function<nlohmann::json(const nlohmann::json&)>;
    std::map<std::string, RouteHandler> routes_;

    GameApiConfig config_;
    chess::GameStateService service_;
    chess::Notation notation_;

    void registerRoutes();

    // Decode "fen" and restore "history" if present
    chess::Board loadBoard(const nlohmann::json& request) const;

    // Read the move from "move" (label or SAN) or from/to/promotion
    chess::Move readMove(const chess::Board& board, const nlohmann::json& request) const;

    // Fields shared by move and status responses
    void describeBoard(const chess::Board& board, nlohmann::json& response) const;

    nlohmann::json handleLegalMoves(const nlohmann::json& request);
    nlohmann::json handleMove(const nlohmann::json& request);
    nlohmann::json handleStatus(const nlohmann::json& request);

    nlohmann::json errorResponse(const std::string& code, const std::string& message) const;
};

} // namespace api
} // namespace igknight

#endif // IGKNIGHT_API_GAME_API_H
