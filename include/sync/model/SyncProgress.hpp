#pragma once

namespace sl::sync::model {

struct SyncProgress {
    unsigned int completed{}, total{};
    bool running{false};
};

}
