#include <re/Error.hpp>
#include <re/Logger.hpp>

namespace re {

namespace {

std::string describe(std::string_view stage, std::string_view pass, const std::string& message)
{
    if (pass.empty()) {
        return fmt::format("{} failed: {}", stage, message);
    }
    return fmt::format("{} failed in pass '{}': {}", stage, pass, message);
}

} // anonymous namespace

FatalError::FatalError(std::string stage, std::string pass, const std::string& message)
    : std::runtime_error(describe(stage, pass, message))
    , m_stage(std::move(stage))
    , m_pass(std::move(pass))
{
}

void fatal(std::string_view stage, std::string_view pass, const std::string& message)
{
    FatalError error{std::string{stage}, std::string{pass}, message};
    Logger::instance().critical("{}", error.what());
    throw error;
}

} // namespace re
