#pragma once

#include <string>

namespace conductor::acp {

// Maps a raw agent/transport error to a message suitable for the chat transcript
std::string friendly_error_message(const std::string& error);

}  // namespace conductor::acp
