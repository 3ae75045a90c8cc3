#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <chrono>
#include <cstdlib>
#include <cctype>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <fmt/format.h>

#include "utils/utils.hpp"

double Utils::unixTime() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

std::string Utils::uuidHex() {
    thread_local boost::uuids::random_generator gen;
    const boost::uuids::uuid id = gen();

    std::string hex;
    hex.reserve(id.size() * 2);
    for (const auto byte : id)
        hex += fmt::format("{:02x}", byte);
    return hex;
}

void Utils::loadENV(const std::string& path) {

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Could not open .env file: " << path << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {

        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string key, value;
        if (std::getline(iss, key, '=') && std::getline(iss, value)) {
            // trim trailing/leading spaces
            while (!key.empty() && std::isspace(static_cast<unsigned char>(key.back())))
                key.pop_back();
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
                value.pop_back();
            while (!key.empty() && std::isspace(static_cast<unsigned char>(key.front())))
                key.erase(0,1);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
                value.erase(0,1);

            // already exported values win over the file
            if (key.empty() || std::getenv(key.c_str()) != nullptr)
                continue;

            if (setenv(key.c_str(), value.c_str(), 1) != 0)
                perror(("setenv failed for " + key).c_str());
        }
    }

}
