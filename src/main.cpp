#include <utility>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <stdexcept>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <fmt/format.h>

#include "config/config.hpp"
#include "config/settings.hpp"
#include "pool/pool.hpp"
#include "pool/errors.hpp"
#include "store/redis_store.hpp"
#include "utils/redis_pool.hpp"
#include "utils/utils.hpp"

namespace asio = boost::asio;

static constexpr int EXIT_NO_ITEM = 2;

static const char* USAGE =
    "usage: leasepool-cli <command> [args]\n"
    "  choose                      lease an item, exits 2 when none is available\n"
    "  replace <item> [lock_till]  return an item, optionally locked until a unix time\n"
    "  add <item>                  add an item if it is not a member yet\n"
    "  remove <item>               remove an item\n"
    "  reset [--preserve] [file]   replace all members, one item per line (stdin without file)\n"
    "  size                        number of members\n"
    "  available                   number of members that can be chosen now\n"
    "  score <item>                unix time at which the item is next available\n";

static std::vector<std::string> readItems(std::istream& in) {
    std::vector<std::string> items;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        items.push_back(std::move(line));
    }
    return items;
}

static double parseTime(const std::string& value) {
    size_t used = 0;
    double parsed = 0;
    try {
        parsed = std::stod(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size())
        throw std::invalid_argument(fmt::format("\"{}\" is not a unix time", value));
    return parsed;
}

static void requireArgs(const std::vector<std::string>& args, size_t min, size_t max) {
    if (args.size() < min || args.size() > max)
        throw std::invalid_argument(fmt::format("wrong number of arguments for {}\n{}", args[0], USAGE));
}

asio::awaitable<void> runCommand(const Pool& pool, const Settings& settings, std::vector<std::string> args) {
    const std::string& cmd = args[0];

    if (cmd == "choose") {
        requireArgs(args, 1, 1);
        std::cout << co_await pool.choose() << std::endl;
    } else if (cmd == "replace") {
        requireArgs(args, 2, 3);
        std::optional<double> lockTill;
        if (args.size() == 3)
            lockTill = parseTime(args[2]);
        co_await pool.replace(args[1], lockTill);
    } else if (cmd == "add") {
        requireArgs(args, 2, 2);
        std::cout << std::boolalpha << co_await pool.add(args[1]) << std::endl;
    } else if (cmd == "remove") {
        requireArgs(args, 2, 2);
        std::cout << std::boolalpha << co_await pool.remove(args[1]) << std::endl;
    } else if (cmd == "reset") {
        requireArgs(args, 1, 3);
        bool preserve = false;
        std::optional<std::string> path;
        for (size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--preserve")
                preserve = true;
            else if (!path)
                path = args[i];
            else
                throw std::invalid_argument(USAGE);
        }

        std::vector<std::string> items;
        if (path) {
            std::ifstream file(*path);
            if (!file.is_open())
                throw std::runtime_error("Could not open items file: " + *path);
            items = readItems(file);
        } else {
            items = readItems(std::cin);
        }

        std::cout << co_await pool.reset(std::move(items), settings.batchSize, preserve) << std::endl;
    } else if (cmd == "size") {
        requireArgs(args, 1, 1);
        std::cout << co_await pool.size() << std::endl;
    } else if (cmd == "available") {
        requireArgs(args, 1, 1);
        std::cout << co_await pool.available() << std::endl;
    } else if (cmd == "score") {
        requireArgs(args, 2, 2);
        const auto score = co_await pool.score(args[1]);
        if (score)
            std::cout << fmt::format("{:.6f}", *score) << std::endl;
        else
            std::cout << "nil" << std::endl;
    } else {
        throw std::invalid_argument(fmt::format("unknown command \"{}\"\n{}", cmd, USAGE));
    }

    co_return;
}

int main(int argc, char** argv) {
    char* envc = std::getenv("ENV");
    std::string env = envc ? envc : "";
    if (env != "PROD")
        Utils::loadENV(".env");

    if (argc < 2) {
        std::cerr << USAGE;
        return EXIT_FAILURE;
    }
    std::vector<std::string> args(argv + 1, argv + argc);

    Settings settings;
    Pool::Options options;
    try {
        settings = Settings::fromEnv();
        options = settings.poolOptions();
    } catch (const std::exception& e) {
        std::cerr << "[ex] " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    asio::io_context ioc;
    int exitCode = EXIT_SUCCESS;

    RedisPool redisPool(ioc.get_executor(), settings.redisConfig(), settings.connections, settings.logLevel);
    auto store = std::make_shared<RedisStore>(redisPool);

    std::optional<Pool> pool;
    try {
        pool.emplace(store, settings.poolKey, std::move(options));
    } catch (const std::exception& e) {
        std::cerr << "[ex] " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    // connections retry forever, so bound the whole command
    asio::steady_timer deadline(ioc);
    deadline.expires_after(std::chrono::seconds(settings.timeoutSeconds));
    deadline.async_wait([&](const boost::system::error_code& ec) {
        if (ec)
            return;
        std::cerr << "[ex] timed out after " << settings.timeoutSeconds << "s talking to "
                  << settings.host << ":" << settings.port << "\n";
        exitCode = EXIT_FAILURE;
        redisPool.cancel();
        ioc.stop();
    });

    asio::co_spawn(ioc, runCommand(*pool, settings, std::move(args)), [&](std::exception_ptr ep) {
        deadline.cancel();
        redisPool.cancel();
        if (!ep)
            return;
        try {
            std::rethrow_exception(ep);
        } catch (const NoItemAvailableError& e) {
            std::cerr << e.what() << "\n";
            exitCode = EXIT_NO_ITEM;
        } catch (const std::exception& e) {
            std::cerr << "[ex] " << e.what() << "\n";
            exitCode = EXIT_FAILURE;
        }
    });

    ioc.run();

    return exitCode;
}
