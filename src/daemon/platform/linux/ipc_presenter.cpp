#include "platform/linux/ipc_presenter.hpp"

#include "ipc_protocol.hpp"

#include <algorithm>

IpcPresenter::IpcPresenter(ReplyChannel& server) : server_(server) {}

void IpcPresenter::show(const StatusView& view) {
    auto event = ipc::status_json(view);
    event["event"] = "status";
    broadcast(event);
}

void IpcPresenter::hide() {
    broadcast({{"event", "hide"}});
}

void IpcPresenter::level(float value) {
    broadcast({{"event", "level"}, {"value", value}});
}

void IpcPresenter::add_watcher(int fd) {
    if (!is_watcher(fd)) watchers_.push_back(fd);
}

void IpcPresenter::remove_watcher(int fd) {
    std::erase(watchers_, fd);
}

bool IpcPresenter::is_watcher(int fd) const {
    return std::ranges::find(watchers_, fd) != watchers_.end();
}

void IpcPresenter::broadcast(const nlohmann::json& event) {
    std::erase_if(watchers_, [this, &event](int fd) {
        return !server_.send_response(fd, event);
    });
}
