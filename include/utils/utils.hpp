#pragma once

#include <string>

namespace Utils {

    // wall clock, seconds since epoch
    double unixTime();
    std::string uuidHex();
    void loadENV(const std::string& path);

}
