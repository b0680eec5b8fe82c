#include "broker/socket_channel.hpp"
#include "broker/reactor.hpp"
#include <spdlog/spdlog.h>

namespace devsnap::broker {

SocketChannel::SocketChannel(Reactor& reactor, DeliverFn deliver, uint32_t conn_id)
    : reactor_(reactor), deliver_(std::move(deliver)), conn_id_(conn_id) {}

bool SocketChannel::send(const ipc::Message& msg) {
    if (!open_) {
        return false;
    }

    return reactor_.post([deliver = deliver_, id = conn_id_, msg]() {
        if (!deliver(id, msg)) {
            spdlog::debug("Dropped {} for closed connection {}", ipc::event_to_string(msg.event), id);
        }
    });
}

std::string SocketChannel::describe() const {
    return "conn#" + std::to_string(conn_id_);
}

} // namespace devsnap::broker
