#pragma once

#include "daemon/app/runtime_state.h"

#include <optional>
#include <string>

namespace daemon_app {

struct AppOverrides {
    // Replays a sound file as a single session instead of the microphone,
    // then exits once that session has finished.
    std::optional<std::string> replayPath;
};

class App {
   public:
    App(RuntimeState& state, std::string configFilePath);

    // Control loop until SIGINT/SIGTERM (or the end of a replay). Returns the
    // process exit code.
    int run(const AppOverrides& overrides);

   private:
    RuntimeState& state_;
    std::string configFilePath_;
};

}  // namespace daemon_app
