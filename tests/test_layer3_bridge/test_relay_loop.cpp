/**
 * @file test_relay_loop.cpp
 * @brief RelayLoop over a FakeChannel and over a real ZMQ PAIR socket.
 */
#include "test_framework/bridge_test_helpers.h"

#include <gtest/gtest.h>

#include <cerrno>
#include <future>
#include <thread>

using namespace gwbridge;
using namespace gwbridge::ipc;
using namespace gwbridge::tests::helper;
using namespace std::chrono_literals;

namespace
{

std::string set_property_frame(const std::string &device_id, bool on)
{
    return encode(GatewayMessage{SetProperty{"p", "a", device_id, Property{"on", on}}});
}

/// Runs a RelayLoop on its own thread for the lifetime of the fixture object.
class RelayHarness
{
  public:
    RelayHarness(DuplexChannel &channel, std::size_t capacity = 16,
                 utils::FullPolicy inbound_policy = utils::FullPolicy::Reject)
        : queues(make_local_channel_pair(capacity, inbound_policy, utils::FullPolicy::Block)),
          loop(channel, *queues.inbound, *queues.outbound, RelayLoop::Config{5ms})
    {
        exit = std::async(std::launch::async, [this] { return loop.run(); });
    }

    ~RelayHarness()
    {
        // Unblock a loop a test left running.
        if (exit.valid() && exit.wait_for(0ms) != std::future_status::ready)
        {
            static_cast<void>(queues.outbound->send(PluginUnloaded{"p"}));
            exit.wait();
        }
    }

    LocalChannelPair queues;
    RelayLoop loop;
    std::future<RelayExit> exit;
};

} // namespace

// ============================================================================
// Inbound direction
// ============================================================================

TEST(RelayLoopTest, DecodedFramesReachInboundQueueInOrder)
{
    FakeChannel channel;
    RelayHarness h(channel);

    channel.push_inbound(set_property_frame("A", true));
    channel.push_inbound(set_property_frame("B", false));

    ASSERT_TRUE(wait_until([&] { return h.queues.inbound->size() == 2; }));
    const auto received = drain(*h.queues.inbound);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(std::get<SetProperty>(received[0]).device_id, "A");
    EXPECT_EQ(std::get<SetProperty>(received[1]).device_id, "B");
}

TEST(RelayLoopTest, MalformedFramesAreDroppedAndLoopContinues)
{
    FakeChannel channel;
    RelayHarness h(channel);

    channel.push_inbound("{ not json");
    channel.push_inbound(R"({"messageType":"mystery","data":{"pluginId":"p"}})");
    channel.push_inbound(R"({"messageType":"setProperty","data":{"pluginId":"p"}})");
    channel.push_inbound(set_property_frame("ok", true));

    ASSERT_TRUE(wait_until([&] { return h.queues.inbound->size() == 1; }));
    const auto received = drain(*h.queues.inbound);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(std::get<SetProperty>(received[0]).device_id, "ok");

    ASSERT_TRUE(wait_until([&] { return h.loop.stats().frames_dropped == 3; }));
    EXPECT_EQ(h.loop.stats().frames_in, 1u);
    EXPECT_TRUE(channel.is_open());
}

TEST(RelayLoopTest, FullInboundQueueRejectsNewFrames)
{
    FakeChannel channel;
    RelayHarness h(channel, 2, utils::FullPolicy::Reject);

    for (const char *id : {"1", "2", "3"})
        channel.push_inbound(set_property_frame(id, true));

    ASSERT_TRUE(wait_until([&] {
        const auto s = h.loop.stats();
        return s.frames_in + s.frames_dropped == 3;
    }));
    const auto received = drain(*h.queues.inbound);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(std::get<SetProperty>(received[0]).device_id, "1");
    EXPECT_EQ(std::get<SetProperty>(received[1]).device_id, "2");
}

// ============================================================================
// Outbound direction
// ============================================================================

TEST(RelayLoopTest, OutboundMessagesAreWrittenInOrder)
{
    FakeChannel channel;
    RelayHarness h(channel);

    ASSERT_EQ(h.queues.outbound->send(AddAdapter{"p", "a", "A"}), utils::SendStatus::Sent);
    ASSERT_EQ(h.queues.outbound->send(HandleDeviceRemoved{"p", "a", "d"}), utils::SendStatus::Sent);

    ASSERT_TRUE(channel.wait_for_writes(2));
    const auto frames = channel.written();
    auto first = decode_plugin_message(frames[0]);
    auto second = decode_plugin_message(frames[1]);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(std::holds_alternative<AddAdapter>(first.content()));
    EXPECT_TRUE(std::holds_alternative<HandleDeviceRemoved>(second.content()));
}

TEST(RelayLoopTest, PluginUnloadedClosesChannelOnceAndEndsSession)
{
    FakeChannel channel;
    RelayHarness h(channel);

    ASSERT_EQ(h.queues.outbound->send(PluginUnloaded{"p"}), utils::SendStatus::Sent);
    ASSERT_EQ(h.exit.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(h.exit.get(), RelayExit::Unloaded);

    const auto frames = channel.written();
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], encode(PluginMessage{PluginUnloaded{"p"}}));
    EXPECT_EQ(channel.close_count(), 1);
    EXPECT_FALSE(channel.is_open());

    // The session is over for both directions.
    EXPECT_EQ(h.queues.outbound->send(PropertyChanged{"p", "a", "d", Property{"x", 1}}),
              utils::SendStatus::Closed);
    EXPECT_TRUE(h.queues.inbound->is_closed());
}

TEST(RelayLoopTest, RecoverableWriteFailureDropsOnlyThatMessage)
{
    FakeChannel channel;
    channel.fail_writes(TransportError("busy", true, EAGAIN), 1);
    RelayHarness h(channel);

    ASSERT_EQ(h.queues.outbound->send(AddAdapter{"p", "lost", "L"}), utils::SendStatus::Sent);
    ASSERT_EQ(h.queues.outbound->send(AddAdapter{"p", "kept", "K"}), utils::SendStatus::Sent);

    ASSERT_TRUE(channel.wait_for_writes(1));
    const auto frames = channel.written();
    ASSERT_EQ(frames.size(), 1u);
    auto decoded = decode_plugin_message(frames[0]);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(std::get<AddAdapter>(decoded.content()).adapter_id, "kept");
    EXPECT_EQ(h.loop.stats().write_failures, 1u);
    EXPECT_TRUE(channel.is_open());
}

TEST(RelayLoopTest, FailedUnloadWriteStillEndsSession)
{
    FakeChannel channel;
    channel.fail_writes(TransportError("busy", true, EAGAIN), 1);
    RelayHarness h(channel);

    ASSERT_EQ(h.queues.outbound->send(PluginUnloaded{"p"}), utils::SendStatus::Sent);
    ASSERT_EQ(h.exit.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(h.exit.get(), RelayExit::Unloaded);
    EXPECT_EQ(channel.close_count(), 1);
}

TEST(RelayLoopTest, UnencodableEventIsDroppedAndUnloadStillDelivered)
{
    FakeChannel channel;
    RelayHarness h(channel);

    // Raw device payloads are not guaranteed to be UTF-8.
    ASSERT_EQ(h.queues.outbound->send(
                  PropertyChanged{"p", "a", "d", Property{"payload", std::string("\xff")}}),
              utils::SendStatus::Sent);
    ASSERT_EQ(h.queues.outbound->send(PluginUnloaded{"p"}), utils::SendStatus::Sent);

    ASSERT_EQ(h.exit.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(h.exit.get(), RelayExit::Unloaded);

    const auto frames = channel.written();
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], encode(PluginMessage{PluginUnloaded{"p"}}));
    EXPECT_EQ(h.loop.stats().write_failures, 1u);
    EXPECT_EQ(channel.close_count(), 1);
    EXPECT_TRUE(h.queues.inbound->is_closed());
}

TEST(RelayLoopTest, UnencodableUnloadStillEndsSession)
{
    FakeChannel channel;
    RelayHarness h(channel);

    ASSERT_EQ(h.queues.outbound->send(PluginUnloaded{"\xfe"}), utils::SendStatus::Sent);
    ASSERT_EQ(h.exit.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(h.exit.get(), RelayExit::Unloaded);
    EXPECT_TRUE(channel.written().empty());
    EXPECT_EQ(channel.close_count(), 1);
}

// ============================================================================
// Channel loss
// ============================================================================

TEST(RelayLoopTest, UnrecoverableReadErrorIsChannelLost)
{
    FakeChannel channel;
    channel.fail_next_read(TransportError("context terminated", false, ETERM));
    RelayHarness h(channel);

    ASSERT_EQ(h.exit.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(h.exit.get(), RelayExit::ChannelLost);
    EXPECT_EQ(channel.close_count(), 1);
    EXPECT_TRUE(h.queues.inbound->is_closed());
    EXPECT_TRUE(h.queues.outbound->is_closed());
}

TEST(RelayLoopTest, RecoverableReadErrorIsRetried)
{
    FakeChannel channel;
    channel.fail_next_read(TransportError("interrupted", true, EINTR));
    RelayHarness h(channel);

    channel.push_inbound(set_property_frame("after", true));
    ASSERT_TRUE(wait_until([&] { return h.queues.inbound->size() == 1; }));
    EXPECT_EQ(h.exit.wait_for(0ms), std::future_status::timeout);
}

// ============================================================================
// Real PAIR socket
// ============================================================================

TEST(RelayLoopTest, RelaysOverZmqPairSocket)
{
    zmq::context_t ctx;
    const std::string endpoint = unique_inproc_endpoint("pair");

    zmq::socket_t gateway(ctx, zmq::socket_type::pair);
    gateway.set(zmq::sockopt::linger, 0);
    gateway.set(zmq::sockopt::rcvtimeo, 2000);
    gateway.bind(endpoint);

    auto queues = make_local_channel_pair();
    {
        ZmqPairChannel channel(ctx, endpoint, ZmqPairChannel::Config{1000ms, 0ms});
        RelayLoop loop(channel, *queues.inbound, *queues.outbound, RelayLoop::Config{5ms});
        std::future<RelayExit> exit = std::async(std::launch::async, [&loop] { return loop.run(); });
        // A failed assertion below must not leave the loop running on a dead channel.
        auto stop_guard = basics::make_scope_guard([&] {
            static_cast<void>(queues.outbound->send(PluginUnloaded{"p"}));
            if (exit.valid())
                exit.wait();
        });

        const std::string command = set_property_frame("lamp", true);
        ASSERT_TRUE(gateway.send(zmq::buffer(command), zmq::send_flags::none).has_value());
        auto inbound = queues.inbound->receive_for(2s);
        ASSERT_TRUE(inbound.has_value());
        EXPECT_EQ(std::get<SetProperty>(*inbound).device_id, "lamp");

        ASSERT_EQ(queues.outbound->send(PropertyChanged{"p", "a", "lamp", Property{"on", true}}),
                  utils::SendStatus::Sent);
        zmq::message_t event;
        ASSERT_TRUE(gateway.recv(event, zmq::recv_flags::none).has_value());
        auto decoded = decode_plugin_message(event.to_string());
        ASSERT_TRUE(decoded.is_ok());
        EXPECT_TRUE(std::holds_alternative<PropertyChanged>(decoded.content()));

        ASSERT_EQ(queues.outbound->send(PluginUnloaded{"p"}), utils::SendStatus::Sent);
        zmq::message_t goodbye;
        ASSERT_TRUE(gateway.recv(goodbye, zmq::recv_flags::none).has_value());
        EXPECT_EQ(goodbye.to_string(), encode(PluginMessage{PluginUnloaded{"p"}}));

        ASSERT_EQ(exit.wait_for(2s), std::future_status::ready);
        EXPECT_EQ(exit.get(), RelayExit::Unloaded);
        EXPECT_FALSE(channel.is_open());
    }
}
