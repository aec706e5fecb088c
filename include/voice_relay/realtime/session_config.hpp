#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "voice_relay/config.hpp"

namespace voice_relay {
namespace realtime {

// The session.update sent once on every new model connection.
nlohmann::json make_session_update(const Config& config, const std::string& instructions);

}
}
