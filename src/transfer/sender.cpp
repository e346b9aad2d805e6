#include "transfer/sender.hpp"
#include "errors.hpp"
#include "networking/interfaces.hpp"
#include "protocol/wire.hpp"
#include "transfer/speed_calculator.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <vector>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace zipline::transfer {

protocol::ControlPayload make_request_payload(const models::TransferSession& session,
                                              const std::string& signature) {
    protocol::ControlPayload payload;
    payload.signature = signature;
    payload.transfer_id = session.id;
    payload.total_files = session.total_files;
    payload.total_size = session.total_size;
    payload.description = models::describe(session.items);
    for (const auto& item : session.items) {
        if (payload.file_names.size() >= kMaxRequestFileNames) break;
        if (item.type == models::ItemType::TEXT) continue;
        if (item.name.find('/') == std::string::npos) payload.file_names.push_back(item.name);
    }
    return payload;
}

void push_session(Connection& connection, models::TransferSession& session, const Config& config,
                  storage::SessionRegistry& registry) {
    session.status = models::TransferStatus::IN_PROGRESS;
    session.data_transfer_started_at = std::chrono::system_clock::now();
    registry.update(session);

    SpeedCalculator speed;
    speed.record(0);
    std::size_t since_update = 0;
    auto publish = [&]() {
        since_update = 0;
        speed.record(session.transferred_size);
        session.current_speed = speed.current_speed();
        registry.update(session);
    };
    auto send = [&connection](const std::vector<uint8_t>& bytes) {
        connection.write_all(bytes.data(), bytes.size());
    };

    send(protocol::encode_session_header(static_cast<int64_t>(session.items.size()), session.total_size));

    std::vector<char> buffer(config.buffer_size);
    for (auto& item : session.items) {
        item.status = models::TransferStatus::IN_PROGRESS;

        switch (item.type) {
        case models::ItemType::FOLDER:
            session.current_file_name = item.name;
            send(protocol::encode_element_header(item.name, protocol::kFolderSize));
            break;

        case models::ItemType::TEXT: {
            session.current_file_name = "Text snippet";
            const auto& text = item.text_content;
            send(protocol::encode_element_header(item.name, static_cast<int64_t>(text.size())));
            if (!text.empty()) {
                connection.write_all(reinterpret_cast<const uint8_t*>(text.data()), text.size());
            }
            session.transferred_size += static_cast<int64_t>(text.size());
            break;
        }

        case models::ItemType::FILE: {
            session.current_file_name = item.name;
            std::ifstream file(fs::u8path(item.path), std::ios::binary);
            if (!file.is_open()) {
                throw IOError("Could not open file for reading: " + item.path);
            }
            send(protocol::encode_element_header(item.name, item.size));

            int64_t remaining = item.size;
            while (remaining > 0) {
                auto want = static_cast<std::streamsize>(
                    std::min<int64_t>(remaining, static_cast<int64_t>(buffer.size())));
                file.read(buffer.data(), want);
                std::streamsize got = file.gcount();
                if (got <= 0) {
                    throw IOError("File shrank while sending: " + item.path);
                }
                connection.write_all(reinterpret_cast<const uint8_t*>(buffer.data()),
                                     static_cast<std::size_t>(got));
                remaining -= got;
                session.transferred_size += got;
                since_update += static_cast<std::size_t>(got);
                if (since_update >= config.progress_update_interval) publish();
            }
            break;
        }
        }

        item.status = models::TransferStatus::COMPLETED;
        session.completed_files += 1;
        publish();
    }

    connection.close();
    session.current_speed = speed.average_speed();
}

// --- TransferSender ---

TransferSender::TransferSender(const Config& config, networking::DiscoveryService& discovery,
                               storage::SessionRegistry& registry)
    : config_(config), discovery_(discovery), registry_(registry) {}

models::TransferSession TransferSender::run(models::TransferSession session) {
    auto cancel = registry_.cancel_token(session.id);

    try {
        await_acceptance(session, cancel);
        transmit(session, cancel);
        session.status = models::TransferStatus::COMPLETED;
        session.error.reset();
    } catch (const Declined& e) {
        session.status = models::TransferStatus::CANCELLED;
        session.error = e.what();
    } catch (const Cancelled& e) {
        session.status = models::TransferStatus::CANCELLED;
        session.error = e.what();
    } catch (const std::exception& e) {
        session.status = models::TransferStatus::FAILED;
        session.error = e.what();
    }

    session.completed_at = std::chrono::system_clock::now();
    if (session.status != models::TransferStatus::COMPLETED) session.current_speed = 0.0;
    registry_.finish(session);
    return session;
}

void TransferSender::await_acceptance(models::TransferSession& session,
                                      const Connection::CancelFlag& cancel) {
    const auto& peer = session.peer;
    session.status = models::TransferStatus::WAITING_FOR_ACCEPTANCE;
    registry_.update(session);

    auto answer = discovery_.expect_response(session.id);
    discovery_.send_control(peer.address, peer.port,
                            protocol::TransferRequest{make_request_payload(session, discovery_.signature())});
    spdlog::info("Waiting for {} to accept transfer {}", peer.display_name(), session.id);

    while (answer.wait_for(Connection::kPollSlice) != std::future_status::ready) {
        if (cancel->load()) {
            discovery_.abandon_response(session.id);
            protocol::ControlPayload payload;
            payload.signature = discovery_.signature();
            payload.transfer_id = session.id;
            payload.data = "Cancelled by sender";
            discovery_.send_control(peer.address, peer.port, protocol::TransferCancel{payload});
            throw Cancelled("Cancelled before the receiver answered");
        }
    }

    auto response = answer.get();
    if (!response.accepted) {
        throw Declined(response.data && !response.data->empty() ? *response.data
                                                                 : std::string("Declined by receiver"));
    }
    if (response.data && !response.data->empty()) {
        session.save_directory = *response.data;
    }
}

void TransferSender::transmit(models::TransferSession& session, const Connection::CancelFlag& cancel) {
    const auto& peer = session.peer;
    Connection connection(cancel);
    auto local = networking::local_address_for(peer.address, discovery_.interfaces());
    connection.connect(peer.address, peer.port, local, config_.tcp_connect_timeout,
                       config_.socket_buffer_size);
    spdlog::info("Connected to {}:{}, sending {} elements ({} bytes)", peer.address, peer.port,
                 session.items.size(), session.total_size);
    push_session(connection, session, config_, registry_);
}

} // namespace zipline::transfer
