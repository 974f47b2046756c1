#pragma once

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace tsync::sync {

/// Upper bound on the number of example paths shown with a prompt
inline constexpr std::size_t kMaxPreviewEntries = 10;

struct ConfirmationRequest {
    std::string title;
    std::size_t total = 0;              ///< Number of operations in the batch
    std::vector<std::string> preview;   ///< At most kMaxPreviewEntries example paths
};

/**
 * @brief Human decision point for destructive batches
 *
 * confirm() blocks the calling cycle until an answer is available.
 */
class ConfirmationGate {
public:
    virtual ~ConfirmationGate() = default;

    virtual bool confirm(const ConfirmationRequest& request) = 0;
};

/**
 * @brief Gate with a preconfigured answer (unattended operation)
 */
class FixedConfirmationGate : public ConfirmationGate {
public:
    explicit FixedConfirmationGate(bool answer) : answer_(answer) {}

    bool confirm(const ConfirmationRequest& request) override;

private:
    bool answer_;
};

/**
 * @brief Interactive yes/no prompt on a terminal
 *
 * Anything but "y" or "yes" (case-insensitive), including end of input,
 * counts as a decline.
 */
class ConsoleConfirmationGate : public ConfirmationGate {
public:
    ConsoleConfirmationGate(std::istream& input, std::ostream& output);

    bool confirm(const ConfirmationRequest& request) override;

private:
    std::istream& input_;
    std::ostream& output_;
    std::mutex mutex_;
};

} // namespace tsync::sync
