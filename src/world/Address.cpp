/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Address.hpp"

namespace Smallville {

std::string joinAddress(const std::vector<std::string>& segments) {
    std::string address;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            address += ADDRESS_DELIMITER;
        }
        address += segments[i];
    }
    return address;
}

std::vector<std::string> splitAddress(std::string_view address) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        const size_t end = address.find(ADDRESS_DELIMITER, start);
        if (end == std::string_view::npos) {
            segments.emplace_back(address.substr(start));
            break;
        }
        segments.emplace_back(address.substr(start, end - start));
        start = end + 1;
    }
    return segments;
}

} // namespace Smallville
