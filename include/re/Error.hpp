#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace re {

/**
 * @brief Unrecoverable configuration error raised while recording a frame
 *
 * Carries the stage that failed (e.g. "pipeline build", "collection build")
 * and the name of the pass it happened in. Nothing in the engine catches it;
 * it is meant to end the frame loop.
 */
class FatalError : public std::runtime_error {
public:
    FatalError(std::string stage, std::string pass, const std::string& message);

    [[nodiscard]] const std::string& stage() const { return m_stage; }
    [[nodiscard]] const std::string& pass() const { return m_pass; }

private:
    std::string m_stage;
    std::string m_pass;
};

/**
 * @brief Log a critical diagnostic and throw FatalError
 *
 * @param stage Operation that failed
 * @param pass Pass name, empty when the failure is not tied to a pass
 * @param message Human readable cause
 */
[[noreturn]] void fatal(std::string_view stage, std::string_view pass, const std::string& message);

} // namespace re
