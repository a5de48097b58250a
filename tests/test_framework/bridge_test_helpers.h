// tests/test_framework/bridge_test_helpers.h
#pragma once

/**
 * @file bridge_test_helpers.h
 * @brief Fakes and small utilities shared by the bridge test suites.
 *
 * - FakeChannel: in-memory DuplexChannel with scripted inbound frames and
 *   injectable transport failures.
 * - RecordingAdapter: Adapter that records every hook invocation.
 * - unique_inproc_endpoint / wait_until / drain helpers.
 */

#include "gwb_bridge.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gwbridge::tests::helper
{

/// "inproc://gwbridge-test-<tag>-<n>", unique within the test process.
std::string unique_inproc_endpoint(std::string_view tag);

/// Polls @p pred every millisecond until it holds or @p timeout passes.
bool wait_until(const std::function<bool()> &pred,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

/// Removes and returns everything currently queued.
std::vector<ipc::PluginMessage> drain(ipc::OutboundQueue &queue);
std::vector<ipc::GatewayMessage> drain(ipc::InboundQueue &queue);

class FakeChannel : public ipc::DuplexChannel
{
  public:
    FakeChannel() = default;

    // --- test side ---
    void push_inbound(std::string frame);
    [[nodiscard]] std::vector<std::string> written() const;
    [[nodiscard]] bool wait_for_writes(std::size_t count,
                                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) const;
    /// The next @p count write() calls throw @p error instead of writing.
    void fail_writes(ipc::TransportError error, int count = 1);
    /// The next try_read() throws @p error.
    void fail_next_read(ipc::TransportError error);
    [[nodiscard]] int close_count() const;

    // --- DuplexChannel ---
    [[nodiscard]] std::optional<std::string> try_read() override;
    void write(std::string_view frame) override;
    [[nodiscard]] bool wait_readable(std::chrono::milliseconds timeout) override;
    void close() noexcept override;
    [[nodiscard]] bool is_open() const noexcept override;
    [[nodiscard]] std::string description() const override { return "fake"; }

  private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    std::deque<std::string> m_inbound;
    std::vector<std::string> m_written;
    std::optional<ipc::TransportError> m_write_error;
    int m_write_failures_left = 0;
    std::optional<ipc::TransportError> m_read_error;
    bool m_open = true;
    int m_close_count = 0;
};

class RecordingAdapter : public plugin::Adapter
{
  public:
    using Adapter::Adapter;

    struct SetPropertyCall
    {
        std::string device_id;
        ipc::Property property;
    };

    plugin::Outcome set_property(const std::string &device_id,
                                 const ipc::Property &property) override;
    plugin::Outcome start_pairing(double timeout_seconds) override;
    plugin::Outcome cancel_pairing() override;
    void unload() override;
    plugin::Outcome remove_thing(const std::string &device_id) override;
    plugin::Outcome cancel_remove_thing(const std::string &device_id) override;

    std::vector<SetPropertyCall> set_property_calls;
    std::vector<double> start_pairing_calls;
    int cancel_pairing_calls = 0;
    int unload_calls = 0;
    std::vector<std::string> remove_thing_calls;
    std::vector<std::string> cancel_remove_thing_calls;
    bool throw_on_set_property = false;
};

} // namespace gwbridge::tests::helper
