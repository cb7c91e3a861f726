#include "main/Config.hh"

#include "IoUtility.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <istream>
#include <new>
#include <stdexcept>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Landlord {
namespace Main {

using namespace std::string_view_literals;

namespace {

struct PlayersTag {};
auto PLAYERS_TAG = PlayersTag {};

constexpr auto DATA_FILE = "data_file"sv;
constexpr auto LOG_LEVEL = "log_level"sv;
constexpr auto PLAYER_FUNCTION = "player"sv;
constexpr auto PLAYER_ID = "id"sv;
constexpr auto PLAYER_NAME = "name"sv;

class LuaPopGuard {
public:
    LuaPopGuard(lua_State* lua);
    ~LuaPopGuard();
private:
    lua_State* lua;
};

LuaPopGuard::LuaPopGuard(lua_State* lua) :
    lua {lua}
{
}

LuaPopGuard::~LuaPopGuard()
{
    lua_pop(lua, 1);
}

constexpr auto READ_CHUNK_SIZE = 4096;
struct LuaStreamReaderArgs {
    LuaStreamReaderArgs(std::istream& in) : in {in}, buf {} {};
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf;
};

extern "C"
const char* config_lua_reader(
    lua_State*, void* data, std::size_t* size)
{
    auto& args = *static_cast<LuaStreamReaderArgs*>(data);
    if (args.in) {
        errno = 0;
        args.in.read(args.buf.data(), args.buf.size());
        if (args.in.bad()) {
            log(LogLevel::WARNING, "Failed to read config: %s", strerror(errno));
        } else {
            *size = args.in.gcount();
            return args.buf.data();
        }
    }
    *size = 0;
    return nullptr;
}

void loadAndExecuteFromStream(lua_State* lua, std::istream& in)
{
    std::istream::sentry s {in, true};
    if (s) {
        const auto reader_args = std::make_unique<LuaStreamReaderArgs>(in);
        auto error = lua_load(
            lua, config_lua_reader, reader_args.get(), "config", nullptr);
        if (!error) {
            const auto out_of_memory_handler =
                std::set_new_handler(std::terminate);
            error = lua_pcall(lua, 0, 0, 0);
            std::set_new_handler(out_of_memory_handler);
        }
        if (error) {
            log(LogLevel::ERROR, "Error while running config script: %s",
                lua_tostring(lua, -1));
            throw std::runtime_error {"Could not process config"};
        }
    } else {
        log(LogLevel::ERROR, "Bad stream while reading config: %s", strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
}

std::optional<std::string> getString(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    if (lua_type(lua, -1) == LUA_TSTRING) {
        return lua_tostring(lua, -1);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected string: %s", key);
    }
    return std::nullopt;
}

const char* getTableString(lua_State* lua, std::string_view key)
{
    lua_pushstring(lua, key.data());
    lua_rawget(lua, 1);
    const auto* ret = lua_tostring(lua, -1);
    lua_pop(lua, 1);
    return ret;
}

extern "C"
int config_lua_player(lua_State* lua) {
    // Lua uses longjmp to handle errors. Care must be taken that non-trivially
    // destructible objects are not in scope when calling Lua API functions that
    // can potentially cause errors.

    luaL_checktype(lua, 1, LUA_TTABLE);
    lua_pushlightuserdata(lua, &PLAYERS_TAG);
    lua_rawget(lua, LUA_REGISTRYINDEX);
    auto& players = *static_cast<Config::PlayerVector*>(
        lua_touserdata(lua, -1));
    lua_pop(lua, 1);

    // The strings stay alive while the table argument is on the stack
    const auto* id = getTableString(lua, PLAYER_ID);
    if (!id) {
        luaL_error(lua, "expected player to have id");
    }
    const auto* name = getTableString(lua, PLAYER_NAME);
    if (!name) {
        name = id;
    }
    players.emplace_back(id, name);
    return 0;
}

}

class Config::Impl {
public:

    Impl();
    Impl(std::istream& in);

    std::optional<std::string_view> getDataFile() const;
    std::optional<LogLevel> getLogLevel() const;
    const PlayerVector& getPlayers() const;

private:

    std::optional<std::string> dataFile {};
    std::optional<LogLevel> logLevel {};
    PlayerVector players {};
};

Config::Impl::Impl() = default;

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    luaL_openlibs(lua.get());

    lua_pushcfunction(lua.get(), config_lua_player);
    lua_setglobal(lua.get(), PLAYER_FUNCTION.data());

    lua_pushlightuserdata(lua.get(), &PLAYERS_TAG);
    lua_pushlightuserdata(lua.get(), &players);
    lua_settable(lua.get(), LUA_REGISTRYINDEX);

    loadAndExecuteFromStream(lua.get(), in);

    dataFile = getString(lua.get(), DATA_FILE);
    if (const auto level_name = getString(lua.get(), LOG_LEVEL)) {
        logLevel = parseLogLevel(*level_name);
        if (!logLevel) {
            log(LogLevel::WARNING, "Unknown log level: %s", *level_name);
        }
    }

    log(LogLevel::INFO, "Reading configs completed, %d players",
        players.size());
}

std::optional<std::string_view> Config::Impl::getDataFile() const
{
    return dataFile;
}

std::optional<LogLevel> Config::Impl::getLogLevel() const
{
    return logLevel;
}

const Config::PlayerVector& Config::Impl::getPlayers() const
{
    return players;
}

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>(in)}
{
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

std::optional<std::string_view> Config::getDataFile() const
{
    return impl->getDataFile();
}

std::optional<LogLevel> Config::getLogLevel() const
{
    return impl->getLogLevel();
}

const Config::PlayerVector& Config::getPlayers() const
{
    return impl->getPlayers();
}

std::string Config::getPlayerName(const PlayerId& playerId) const
{
    const auto& players = impl->getPlayers();
    const auto iter = std::ranges::find(players, playerId, &Player::id);
    if (iter == players.end()) {
        return playerId;
    }
    return iter->name;
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    } else {
        errno = 0;
        return processStreamFromPath(
            path, [](auto& in) { return Config {in}; });
    }
}

}
}
