#pragma once

#include "platform/ipc_server.hpp"
#include "platform/presenter.hpp"

#include <vector>

// Pushes status frames to every client that sent `watch`. A watcher whose socket fails is
// dropped on the next event.
class IpcPresenter : public Presenter {
public:
    explicit IpcPresenter(ReplyChannel& server);

    void show(const StatusView& view) override;
    void hide() override;
    void level(float value) override;

    void add_watcher(int fd);
    void remove_watcher(int fd);
    bool is_watcher(int fd) const;

private:
    void broadcast(const nlohmann::json& event);

    ReplyChannel& server_;
    std::vector<int> watchers_;
};
