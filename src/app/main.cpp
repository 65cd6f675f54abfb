#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/dispatcher.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/warden_errors.hpp"
#include "core/logging/logger.hpp"

int main(int argc, char* argv[]) {
    auto parsed = warden::app::cli::parse_and_validate(argc, argv);
    if (warden::core::errors::is_error(parsed)) {
        const auto& err = warden::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return warden::app::kExitInputError;
    }
    const auto& req = warden::core::errors::get_value(parsed);

    // The host passes its own session id; standalone use gets a fresh one.
    const std::string session_id = req.session_id.has_value()
                                       ? req.session_id.value()
                                       : warden::core::config::generate_session_id();

    auto& logger = warden::core::logging::Logger::get();
    logger.set_session_id(session_id);
    if (req.verbose) {
        logger.set_min_level(warden::core::logging::LogLevel::DEBUG);
    }

    return warden::app::dispatch(req, session_id, std::cin, std::cout);
}
