// include/igknight/cli/cli_interface.h
#ifndef IGKNIGHT_CLI_CLI_INTERFACE_H
#define IGKNIGHT_CLI_CLI_INTERFACE_H

#include <string>
#include <vector>
#include <functional>
#include <map>
#include <set>
#include "igknight/api/game_api.h"
#include "igknight/chess/board.h"
#include "igknight/chess/game_state_service.h"
#include "igknight/chess/notation.h"

namespace igknight {
namespace cli {

/**
 * @brief Interactive shell around the rules engine
 *
 * Holds one board, applies moves typed as labels or SAN, and keeps the
 * previous boards so moves can be taken back.
 */
class CLIInterface {
public:
    /**
     * @brief Constructor
     *
     * @param config Options for the embedded request handler
     */
    explicit CLIInterface(const api::GameApiConfig& config = api::GameApiConfig());

    /**
     * @brief Run the CLI in interactive mode
     *
     * @return Exit code
     */
    int run();

    /**
     * @brief Execute one line of shell input
     *
     * @param line Raw input line
     * @return true if the command succeeded, false otherwise
     */
    bool executeLine(const std::string& line);

    /**
     * @brief Execute a single command
     *
     * @param command Command to execute
     * @param args Arguments for the command
     * @return true if successful, false for an unknown command or a failure
     */
    bool executeCommand(const std::string& command, const std::vector<std::string>& args);

    /**
     * @brief Set output callback for flexibility in displaying output
     *
     * @param callback Callback function that takes a string
     */
    void setOutputCallback(std::function<void(const std::string&)> callback);

    /**
     * @brief Set input callback for flexibility in getting input
     *
     * @param callback Callback function that returns a string
     */
    void setInputCallback(std::function<std::string()> callback);

    const chess::Board& getBoard() const { return board_; }
    size_t getUndoDepth() const { return undoStack_.size(); }
    bool isRunning() const { return running_; }

private:
    // Callbacks for I/O
    std::function<void(const std::string&)> outputCallback_;
    std::function<std::string()> inputCallback_;

    chess::Board board_;
    std::vector<chess::Board> undoStack_;
    chess::GameStateService service_;
    chess::Notation notation_;
    api::GameApi api_;
    bool running_ = true;

    // Command handlers
    using CommandHandler = std::function<bool(const std::vector<std::string>&)>;
    std::map<std::string, CommandHandler> commands_;
    std::map<std::string, std::string> commandHelp_;

    // Commands that take the rest of the line as a single argument
    std::set<std::string> rawCommands_;

    void registerCommands();

    void output(const std::string& message);
    std::string input();

    bool cmdHelp(const std::vector<std::string>& args);
    bool cmdNew(const std::vector<std::string>& args);
    bool cmdFen(const std::vector<std::string>& args);
    bool cmdShow(const std::vector<std::string>& args);
    bool cmdMoves(const std::vector<std::string>& args);
    bool cmdPlay(const std::vector<std::string>& args);
    bool cmdUndo(const std::vector<std::string>& args);
    bool cmdStatus(const std::vector<std::string>& args);
    bool cmdRequest(const std::vector<std::string>& args);
    bool cmdQuit(const std::vector<std::string>& args);
};

} // namespace cli
} // namespace igknight

#endif // IGKNIGHT_CLI_CLI_INTERFACE_H
