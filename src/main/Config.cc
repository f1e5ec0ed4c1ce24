#include "main/Config.hh"

#include "Logging.hh"

#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <istream>
#include <iterator>
#include <limits>
#include <new>
#include <stdexcept>
#include <utility>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Shuffle {
namespace Main {

using namespace std::string_view_literals;

namespace {

constexpr auto TRIALS = "trials"sv;
constexpr auto SEED = "seed"sv;
constexpr auto BATCHES = "batches"sv;
constexpr auto ELEMENTS = "elements"sv;

using LuaState = std::unique_ptr<lua_State, decltype(&lua_close)>;

// Restores the Lua stack to the height it had when the guard was created
class LuaStackGuard {
public:
    explicit LuaStackGuard(lua_State* lua) : lua {lua}, top {lua_gettop(lua)}
    {
    }

    ~LuaStackGuard()
    {
        lua_settop(lua, top);
    }

    LuaStackGuard(const LuaStackGuard&) = delete;
    LuaStackGuard& operator=(const LuaStackGuard&) = delete;

private:
    lua_State* lua;
    int top;
};

std::string readScript(std::istream& in)
{
    if (!in) {
        log(LogLevel::ERROR, "Bad stream while reading config: %s",
            std::strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
    auto script = std::string(
        std::istreambuf_iterator<char> {in}, std::istreambuf_iterator<char> {});
    if (in.bad()) {
        log(LogLevel::ERROR, "Error while reading config: %s",
            std::strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
    return script;
}

void runScript(lua_State* lua, const std::string& script)
{
    auto error = luaL_loadbufferx(
        lua, script.data(), script.size(), "config", "t");
    if (!error) {
        // Lua reports errors with longjmp, so the C++ runtime must not
        // unwind through the interpreter
        const auto new_handler = std::set_new_handler(std::terminate);
        error = lua_pcall(lua, 0, 0, 0);
        std::set_new_handler(new_handler);
    }
    if (error) {
        log(LogLevel::ERROR, "Error while running config script: %s",
            lua_tostring(lua, -1));
        lua_pop(lua, 1);
        throw std::runtime_error {"Could not process config"};
    }
}

std::optional<long> readInteger(lua_State* lua, const std::string_view name)
{
    const auto guard = LuaStackGuard {lua};
    lua_getglobal(lua, name.data());
    if (lua_isnil(lua, -1)) {
        return std::nullopt;
    }
    auto is_integer = 0;
    const auto value = lua_tointegerx(lua, -1, &is_integer);
    if (!is_integer) {
        log(LogLevel::WARNING, "Ignoring %s: expected integer", name);
        return std::nullopt;
    }
    return static_cast<long>(value);
}

std::optional<Config::ElementVector> readElements(
    lua_State* lua, const std::string_view name)
{
    const auto guard = LuaStackGuard {lua};
    lua_getglobal(lua, name.data());
    if (lua_isnil(lua, -1)) {
        return std::nullopt;
    } else if (!lua_istable(lua, -1)) {
        log(LogLevel::WARNING, "Ignoring %s: expected array", name);
        return std::nullopt;
    }
    const auto size = static_cast<lua_Integer>(lua_rawlen(lua, -1));
    auto elements = Config::ElementVector {};
    elements.reserve(size);
    for (auto n = lua_Integer {1}; n <= size; ++n) {
        lua_rawgeti(lua, -1, n);
        // lua_isstring() accepts numbers, lua_tolstring() converts them
        if (!lua_isstring(lua, -1)) {
            log(LogLevel::WARNING,
                "Ignoring %s: element %d is not a string or a number",
                name, n);
            return std::nullopt;
        }
        auto length = std::size_t {};
        const auto* str = lua_tolstring(lua, -1, &length);
        elements.emplace_back(str, length);
        lua_pop(lua, 1);
    }
    return elements;
}

template<typename Integer>
std::optional<Integer> narrowInteger(
    const std::optional<long> value, const std::string_view name,
    const long min)
{
    if (!value) {
        return std::nullopt;
    }
    if (*value < min ||
        static_cast<unsigned long>(*value) >
        std::numeric_limits<Integer>::max()) {
        log(LogLevel::WARNING, "Ignoring %s: %d is out of range", name, *value);
        return std::nullopt;
    }
    return static_cast<Integer>(*value);
}

}

class Config::Impl {
public:
    long trials {1000000};
    std::optional<Seed> seed;
    int batches {1};
    ElementVector elements {"1", "2", "3"};
};

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>()}
{
    log(LogLevel::INFO, "Reading configs");

    const auto script = readScript(in);
    const auto lua = LuaState {luaL_newstate(), &lua_close};
    if (!lua) {
        throw std::bad_alloc {};
    }
    luaL_openlibs(lua.get());
    runScript(lua.get(), script);

    if (const auto trials = readInteger(lua.get(), TRIALS)) {
        impl->trials = *trials;
    }
    if (const auto seed = narrowInteger<Seed>(
            readInteger(lua.get(), SEED), SEED, 0)) {
        impl->seed = *seed;
    }
    if (const auto batches = narrowInteger<int>(
            readInteger(lua.get(), BATCHES), BATCHES, 1)) {
        impl->batches = *batches;
    }
    if (auto elements = readElements(lua.get(), ELEMENTS)) {
        impl->elements = std::move(*elements);
    }

    log(LogLevel::INFO, "Reading configs completed");
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

long Config::getTrials() const
{
    assert(impl);
    return impl->trials;
}

std::optional<Seed> Config::getSeed() const
{
    assert(impl);
    return impl->seed;
}

int Config::getBatches() const
{
    assert(impl);
    return impl->batches;
}

auto Config::getElements() const -> const ElementVector&
{
    assert(impl);
    return impl->elements;
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    } else if (path == "-") {
        return Config {std::cin};
    }
    log(LogLevel::INFO, "Opening config file %s", path);
    errno = 0;
    auto in = std::ifstream {std::string {path}};
    return Config {in};
}

}
}
