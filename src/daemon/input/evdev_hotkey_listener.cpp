#include "daemon/input/evdev_hotkey_listener.h"

#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace daemon_input {
namespace {

constexpr int kPollTimeoutMs = 100;
constexpr int kRescanDelayMs = 2000;

constexpr size_t bitsToLongs(size_t bits) {
    return (bits + 8 * sizeof(unsigned long) - 1) / (8 * sizeof(unsigned long));
}

bool testBit(const unsigned long* bits, int bit) {
    return (bits[bit / (8 * sizeof(unsigned long))] >> (bit % (8 * sizeof(unsigned long)))) & 1UL;
}

// EV_KEY device that also reports KEY_A: keyboards, not mice or power buttons.
bool isKeyboard(int fd) {
    unsigned long evbits[bitsToLongs(EV_MAX + 1)] = {};
    if (ioctl(fd, EVIOCGBIT(0, sizeof(evbits)), evbits) < 0 || !testBit(evbits, EV_KEY)) {
        return false;
    }
    unsigned long keybits[bitsToLongs(KEY_MAX + 1)] = {};
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keybits)), keybits) < 0) {
        return false;
    }
    return testBit(keybits, KEY_A);
}

}  // namespace

struct EvdevHotkeyListener::Device {
    int fd = -1;
    std::string sourceId;
    std::vector<HotkeyStateFilter> filters;

    ~Device() {
        if (fd >= 0) {
            close(fd);
        }
    }
};

EvdevHotkeyListener::EvdevHotkeyListener(std::vector<HotkeyBinding> bindings, std::string inputDir)
    : bindings_(std::move(bindings)), inputDir_(std::move(inputDir)) {}

EvdevHotkeyListener::~EvdevHotkeyListener() {
    stop();
}

size_t EvdevHotkeyListener::deviceCount() const {
    return devices_.size();
}

bool EvdevHotkeyListener::start(HotkeyCallback callback) {
    if (running_.load()) {
        return true;
    }
    if (bindings_.empty()) {
        LOG_WARN("Hotkey: no bindings configured, evdev listener not started");
        return false;
    }
    if (!openKeyboards()) {
        LOG_ERROR("Hotkey: no readable keyboard under {} (is the user in the 'input' group?)",
                  inputDir_);
        return false;
    }

    callback_ = std::move(callback);
    running_.store(true);
    thread_ = std::thread(&EvdevHotkeyListener::listenLoop, this);
    return true;
}

void EvdevHotkeyListener::stop() {
    if (running_.exchange(false) && thread_.joinable()) {
        thread_.join();
    }
    closeDevices();
}

bool EvdevHotkeyListener::openKeyboards() {
    closeDevices();

    DIR* dir = opendir(inputDir_.c_str());
    if (!dir) {
        LOG_ERROR("Hotkey: cannot open {}: {}", inputDir_, strerror(errno));
        return false;
    }

    std::vector<std::string> paths;
    while (dirent* entry = readdir(dir)) {
        if (strncmp(entry->d_name, "event", 5) == 0) {
            paths.push_back(inputDir_ + "/" + entry->d_name);
        }
    }
    closedir(dir);
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            LOG_DEBUG("Hotkey: skip {}: {}", path, strerror(errno));
            continue;
        }
        if (!isKeyboard(fd)) {
            close(fd);
            continue;
        }

        char name[256] = "unknown";
        if (ioctl(fd, EVIOCGNAME(sizeof(name)), name) < 0) {
            strncpy(name, "unknown", sizeof(name));
        }
        auto device = std::make_unique<Device>();
        device->fd = fd;
        device->sourceId = "evdev:" + path;
        for (const auto& binding : bindings_) {
            device->filters.emplace_back(binding);
        }
        LOG_INFO("Hotkey: watching {} ({})", path, name);
        devices_.push_back(std::move(device));
    }
    return !devices_.empty();
}

void EvdevHotkeyListener::closeDevices() {
    devices_.clear();
}

void EvdevHotkeyListener::listenLoop() {
    bool needsRescan = false;

    while (running_.load()) {
        if (needsRescan) {
            needsRescan = false;
            // Held keys of a vanished device are released so hold sessions end.
            for (const auto& device : devices_) {
                for (size_t i = 0; i < device->filters.size(); ++i) {
                    if (device->filters[i].active() && callback_) {
                        callback_(i, false, device->sourceId);
                    }
                }
            }
            LOG_WARN("Hotkey: input device change detected, rescanning");
            if (!openKeyboards()) {
                for (int waited = 0; waited < kRescanDelayMs && running_.load();
                     waited += kPollTimeoutMs) {
                    usleep(kPollTimeoutMs * 1000);
                }
                needsRescan = true;
            }
            continue;
        }

        std::vector<pollfd> fds;
        fds.reserve(devices_.size());
        for (const auto& device : devices_) {
            fds.push_back(pollfd{device->fd, POLLIN, 0});
        }
        int ready = poll(fds.data(), fds.size(), kPollTimeoutMs);
        if (ready < 0) {
            if (errno != EINTR) {
                LOG_ERROR("Hotkey: poll failed: {}", strerror(errno));
                needsRescan = true;
            }
            continue;
        }
        if (ready == 0) {
            continue;
        }

        for (size_t d = 0; d < devices_.size(); ++d) {
            if (fds[d].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                LOG_WARN("Hotkey: {} disconnected", devices_[d]->sourceId);
                needsRescan = true;
                continue;
            }
            if (!(fds[d].revents & POLLIN)) {
                continue;
            }

            Device& device = *devices_[d];
            input_event ev{};
            while (true) {
                ssize_t n = read(device.fd, &ev, sizeof(ev));
                if (n != static_cast<ssize_t>(sizeof(ev))) {
                    if (n < 0 && (errno == EIO || errno == ENODEV)) {
                        needsRescan = true;
                    }
                    break;
                }
                if (ev.type != EV_KEY) {
                    continue;
                }
                for (size_t i = 0; i < device.filters.size(); ++i) {
                    KeyTransition transition = device.filters[i].onKey(ev.code, ev.value);
                    if (transition == KeyTransition::None || !callback_) {
                        continue;
                    }
                    LOG_DEBUG("Hotkey: '{}' {} on {}", device.filters[i].binding().text,
                              transition == KeyTransition::Pressed ? "pressed" : "released",
                              device.sourceId);
                    callback_(i, transition == KeyTransition::Pressed, device.sourceId);
                }
            }
        }
    }
}

}  // namespace daemon_input
