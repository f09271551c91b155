// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>

namespace wlink {

class FailureReporter;
class FrameChannel;
class RuntimeContext;
class Sender;
class TaskConfiguration;

/**
 * Pushes the task's broadcast variables to the worker before streaming starts.
 *
 * Wire sequence, every step answering one BUFFER_REQUEST:
 *   count (one record, last)
 *   per name: name (one record, last), then element chunks until one is marked last.
 * An empty collection still gets a single empty last chunk.
 */
class BroadcastDistributor {
public:
    BroadcastDistributor(FrameChannel& channel, Sender& sender, const FailureReporter& reporter);

    void distribute(const TaskConfiguration& config, RuntimeContext& context);

    void distribute(const std::vector<std::string>& names, RuntimeContext& context);

private:
    void await_buffer_request();

    FrameChannel& channel_;
    Sender& sender_;
    const FailureReporter& reporter_;
};

}  // namespace wlink
