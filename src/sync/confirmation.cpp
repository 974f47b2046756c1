#include "tsync/sync/confirmation.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace tsync::sync {

bool FixedConfirmationGate::confirm(const ConfirmationRequest& request) {
    spdlog::info("{} ({} item(s)): answered {} by configuration",
                 request.title, request.total, answer_ ? "yes" : "no");
    return answer_;
}

ConsoleConfirmationGate::ConsoleConfirmationGate(std::istream& input, std::ostream& output)
    : input_(input), output_(output) {}

bool ConsoleConfirmationGate::confirm(const ConfirmationRequest& request) {
    std::lock_guard lock(mutex_);

    output_ << '\n' << request.title << " (" << request.total << " item(s))\n";
    for (const auto& path : request.preview) {
        output_ << "  - " << path << '\n';
    }
    if (request.total > request.preview.size()) {
        output_ << "  ... and " << (request.total - request.preview.size()) << " more\n";
    }
    output_ << "Proceed? [y/N] " << std::flush;

    std::string answer;
    if (!std::getline(input_, answer)) {
        return false;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    answer.erase(std::remove_if(answer.begin(), answer.end(),
                                [](unsigned char c) { return std::isspace(c) != 0; }),
                 answer.end());
    return answer == "y" || answer == "yes";
}

} // namespace tsync::sync
