/** \file
 *
 * \brief Definition of Landlord::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "landlord/Player.hh"
#include "Logging.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Landlord {
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration is a Lua script. The following globals and functions are
 * recognized:
 *
 * \code{.lua}
 * data_file = "landlord.json"
 * log_level = "info"
 * player { id = "p1", name = "Alice" }
 * \endcode
 *
 * - \c data_file is the path of the JSON document holding the history
 * - \c log_level is the name of the minimum logging level (see
 *   parseLogLevel())
 * - each call of \c player registers a player in the roster
 */
class Config {
public:

    /** \brief Vector of players in the roster
     */
    using PlayerVector = std::vector<Player>;

    /** \brief Create empty configs
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the script
     * fails
     */
    explicit Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get data file
     *
     * \return Path to the data file, or nullopt if the configuration does not
     * define it
     */
    std::optional<std::string_view> getDataFile() const;

    /** \brief Get log level
     *
     * \return The log level, or nullopt if the configuration does not define
     * a valid level
     */
    std::optional<LogLevel> getLogLevel() const;

    /** \brief Get the players in the roster
     *
     * \return reference to the players in the order they were registered
     */
    const PlayerVector& getPlayers() const;

    /** \brief Find the display name of a player
     *
     * \param playerId the identifier of the player
     *
     * \return the name of the player in the roster, or \p playerId if the
     * player is not in the roster
     */
    std::string getPlayerName(const PlayerId& playerId) const;

private:

    class Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, empty configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
