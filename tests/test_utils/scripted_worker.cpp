// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

// Stand-in for a real worker process. It is launched as
//   scripted_worker <flags...> <plan path> <mode>
// reads the handshake from stdin and then behaves according to <mode>.

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "worker_side_channel.hpp"

using namespace wlink;
using namespace wlink::test_utils;

namespace {

struct Handshake {
    uint16_t port = 0;
    std::string id;
    std::string input;
    std::string output;
};

bool read_handshake(Handshake& handshake) {
    std::string marker;
    std::string port;
    if (!std::getline(std::cin, marker) || marker != "operator") {
        return false;
    }
    if (!std::getline(std::cin, port) || !std::getline(std::cin, handshake.id) ||
        !std::getline(std::cin, handshake.input) || !std::getline(std::cin, handshake.output)) {
        return false;
    }
    handshake.port = static_cast<uint16_t>(std::stoi(port));
    return true;
}

[[noreturn]] void sleep_forever() {
    while (true) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}

// Receives the broadcast variables and returns every element of every variable.
std::vector<Record> receive_broadcast(WorkerSideChannel& channel, const Handshake& handshake) {
    std::vector<Record> elements;
    const std::vector<Record> count = channel.request_buffer(handshake.input);
    const int32_t variables = signal::get_int(count.at(0).data());
    for (int32_t i = 0; i < variables; i++) {
        const std::vector<Record> name = channel.request_buffer(handshake.input);
        std::cerr << "broadcast variable " << to_string(name.at(0)) << std::endl;
        WorkerSideChannel::Notification notification{0, true, signal::FLAG_MORE};
        while (notification.has_next) {
            for (Record& element : channel.request_buffer(handshake.input, &notification)) {
                elements.push_back(std::move(element));
            }
        }
    }
    return elements;
}

// Echoes every input buffer back as a result buffer.
void echo(WorkerSideChannel& channel, const Handshake& handshake) {
    WorkerSideChannel::Notification notification{0, true, signal::FLAG_MORE};
    while (notification.has_next) {
        std::vector<Record> records = channel.request_buffer(handshake.input, &notification);
        if (!records.empty()) {
            channel.send_result(handshake.output, records);
        }
    }
    channel.send_signal(signal::FINISHED);
}

}  // namespace

int run(int argc, char* argv[]) {
    const std::string mode = argc > 1 ? argv[argc - 1] : "echo";

    Handshake handshake;
    if (!read_handshake(handshake)) {
        std::cerr << "malformed handshake" << std::endl;
        return 2;
    }

    if (mode == "crash") {
        std::cerr << "scripted worker crashed on startup" << std::endl;
        return 3;
    }
    if (mode == "silent") {
        sleep_forever();
    }

    WorkerSideChannel channel(handshake.port);

    if (mode == "echo") {
        echo(channel, handshake);
    } else if (mode == "broadcast_echo") {
        const std::vector<Record> elements = receive_broadcast(channel, handshake);
        if (!elements.empty()) {
            channel.send_result(handshake.output, elements);
        }
        echo(channel, handshake);
    } else if (mode == "error") {
        std::cerr << "Traceback: scripted failure in plan" << std::endl;
        channel.send_signal(signal::ERROR);
        sleep_forever();
    } else if (mode == "hang") {
        sleep_forever();
    } else if (mode == "disconnect") {
        std::cerr << "scripted worker lost its connection" << std::endl;
        channel.close();
        sleep_forever();
    } else {
        std::cerr << "unknown mode " << mode << std::endl;
        return 2;
    }

    channel.close();
    // Stay alive until the bridge terminates the process.
    sleep_forever();
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "scripted worker failed: " << e.what() << std::endl;
        return 1;
    }
}
