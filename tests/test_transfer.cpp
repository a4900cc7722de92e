#include <pylon/session.hpp>
#include <pylon/session_builder.hpp>
#include <pylon/channel/local_rendezvous.hpp>
#include <pylon/logger.hpp>
#include <pylon/transfer/message_channel.hpp>
#include <pylon/transfer/offer_receiver.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <sstream>
#include <string>

using namespace pylon;

namespace
{
// Hands its contents to a shared string when the transfer releases it.
class capturing_stream : public std::ostringstream
{
    std::shared_ptr<std::string> sink_;

  public:
    explicit capturing_stream(std::shared_ptr<std::string> sink)
      : sink_(std::move(sink))
    {
    }

    ~capturing_stream() override
    {
        *sink_ = str();
    }
};

std::string pattern(std::size_t size)
{
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
        data[i] = static_cast<char>(i * 31 + 7);
    return data;
}

void expect_monotonic(const std::vector<progress_event>& events, uint64_t total)
{
    ASSERT_FALSE(events.empty());
    for (std::size_t i = 1; i < events.size(); ++i)
        EXPECT_GE(events[i].bytes_transferred, events[i - 1].bytes_transferred);
    for (const auto& event : events)
        EXPECT_EQ(event.total_bytes, total);
    EXPECT_EQ(events.back().bytes_transferred, total);
}
}  // namespace

class TransferTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        logger::instance().set_level(log_level::warning);
        rendezvous = std::make_shared<channel::local_rendezvous>(io_context);
        alice = session_builder{}.with_chunk_size(256).build(io_context, rendezvous);
        bob = session_builder{}.with_chunk_size(256).build(io_context, rendezvous);
    }

    void TearDown() override
    {
        logger::instance().set_level(log_level::info);
    }

    void run()
    {
        io_context.restart();
        io_context.run();
    }

    void connect_pair()
    {
        std::optional<result<std::string>> code;
        alice->generate_code(2, [&](result<std::string> r) { code = std::move(r); });
        run();
        ASSERT_TRUE(code && *code);
        EXPECT_EQ(std::count(code->value().begin(), code->value().end(), '-'), 2);

        bob->connect_with_code(code->value(), [](result<void> r) { EXPECT_TRUE(r); });
        run();

        ASSERT_EQ(alice->status(), session_status::connected);
        ASSERT_EQ(bob->status(), session_status::connected);
    }

    void send(const std::string& data, const std::string& name, uint64_t declared_size, cancel_token cancel = {})
    {
        alice->send_file(std::make_unique<std::istringstream>(data), name, declared_size, sender_progress, std::move(cancel),
                         [this](result<transfer_outcome> r) { sent = std::move(r); });
    }

    void request(cancel_token cancel = {})
    {
        bob->request_file(std::move(cancel), [this](result<transfer_outcome> r) { requested = std::move(r); });
    }

    void accept(cancel_token cancel = {})
    {
        ASSERT_TRUE(bob->pending_offer());
        bob->pending_offer()->accept(std::make_unique<capturing_stream>(received_data), receiver_progress, std::move(cancel),
                                     [this](result<transfer_outcome> r) { accepted = std::move(r); });
    }

    boost::asio::io_context io_context;
    std::shared_ptr<channel::local_rendezvous> rendezvous;
    session_ptr alice;
    session_ptr bob;

    std::shared_ptr<progress_queue> sender_progress{std::make_shared<progress_queue>()};
    std::shared_ptr<progress_queue> receiver_progress{std::make_shared<progress_queue>()};
    std::shared_ptr<std::string> received_data{std::make_shared<std::string>()};

    std::optional<result<transfer_outcome>> sent;
    std::optional<result<transfer_outcome>> requested;
    std::optional<result<transfer_outcome>> accepted;
    offer_ptr pending;
};

TEST_F(TransferTest, EndToEnd)
{
    connect_pair();

    auto data = pattern(1024);
    send(data, "test.bin", data.size());
    request();
    run();

    ASSERT_TRUE(requested);
    ASSERT_TRUE(*requested) << requested->error().what();
    EXPECT_EQ(requested->value(), transfer_outcome::completed);

    auto offer = bob->pending_offer();
    ASSERT_TRUE(offer);
    EXPECT_EQ(offer->file_name(), "test.bin");
    EXPECT_EQ(offer->file_size(), 1024u);
    EXPECT_FALSE(sent);

    accept();
    run();

    ASSERT_TRUE(sent && accepted);
    ASSERT_TRUE(*sent) << sent->error().what();
    ASSERT_TRUE(*accepted) << accepted->error().what();
    EXPECT_EQ(sent->value(), transfer_outcome::completed);
    EXPECT_EQ(accepted->value(), transfer_outcome::completed);
    EXPECT_EQ(*received_data, data);

    auto sender_events = sender_progress->drain();
    EXPECT_EQ(sender_events.size(), 4u);
    expect_monotonic(sender_events, 1024);
    expect_monotonic(receiver_progress->drain(), 1024);

    EXPECT_TRUE(offer->is_answered());
    EXPECT_EQ(alice->status(), session_status::consumed);
    EXPECT_EQ(bob->status(), session_status::consumed);
}

TEST_F(TransferTest, EmptyFile)
{
    connect_pair();

    send("", "empty.txt", 0);
    request();
    run();
    accept();
    run();

    ASSERT_TRUE(sent && *sent);
    ASSERT_TRUE(accepted && *accepted);
    EXPECT_TRUE(received_data->empty());
    EXPECT_EQ(sender_progress->last(), (progress_event{0, 0}));
    EXPECT_EQ(receiver_progress->last(), (progress_event{0, 0}));
}

TEST_F(TransferTest, ChannelIsSingleUse)
{
    connect_pair();

    send("abc", "a.txt", 3);

    std::optional<result<transfer_outcome>> second, requested_too;
    alice->send_file(std::make_unique<std::istringstream>("abc"), "a.txt", 3, nullptr, {}, [&](result<transfer_outcome> r) { second = std::move(r); });
    alice->request_file({}, [&](result<transfer_outcome> r) { requested_too = std::move(r); });
    run();

    ASSERT_TRUE(second && requested_too);
    EXPECT_EQ(second->error().kind(), errc::generic);
    EXPECT_EQ(requested_too->error().kind(), errc::generic);
    EXPECT_EQ(alice->status(), session_status::consumed);
}

TEST_F(TransferTest, ReceiverRejects)
{
    connect_pair();

    send("abc", "a.txt", 3);
    request();
    run();

    auto offer = bob->pending_offer();
    ASSERT_TRUE(offer);

    std::optional<result<void>> rejected;
    offer->reject([&](result<void> r) { rejected = std::move(r); });
    run();

    ASSERT_TRUE(rejected && *rejected);
    ASSERT_TRUE(sent);
    ASSERT_FALSE(*sent);
    EXPECT_EQ(sent->error().kind(), errc::transfer);

    // Answered once only.
    accept();
    std::optional<result<void>> again;
    offer->reject([&](result<void> r) { again = std::move(r); });
    run();

    ASSERT_TRUE(accepted && again);
    EXPECT_EQ(accepted->error().kind(), errc::generic);
    EXPECT_EQ(again->error().kind(), errc::generic);
}

TEST_F(TransferTest, SourceShorterThanDeclared)
{
    connect_pair();

    send(pattern(100), "short.bin", 200);
    request();
    run();
    accept();
    run();

    ASSERT_TRUE(sent && accepted);
    ASSERT_FALSE(*sent);
    EXPECT_EQ(sent->error().kind(), errc::transfer);
    ASSERT_FALSE(*accepted);
    EXPECT_EQ(accepted->error().kind(), errc::transfer);
    EXPECT_NE(accepted->error().message().find("peer aborted"), std::string::npos);
}

TEST_F(TransferTest, SourceLongerThanDeclared)
{
    connect_pair();

    send(pattern(300), "long.bin", 200);
    request();
    run();
    accept();
    run();

    ASSERT_TRUE(sent && accepted);
    ASSERT_FALSE(*sent);
    EXPECT_EQ(sent->error().kind(), errc::transfer);
    ASSERT_FALSE(*accepted);
    EXPECT_EQ(accepted->error().kind(), errc::transfer);
}

TEST_F(TransferTest, SenderCancelsMidTransfer)
{
    connect_pair();

    cancel_source cancel;
    auto data = pattern(64 * 1024);
    send(data, "big.bin", data.size(), cancel.token());
    request();
    run();
    accept();

    io_context.restart();
    while (!(sent && accepted) && io_context.run_one())
    {
        if (!cancel.is_cancelled() && sender_progress->size() >= 2)
            cancel.cancel();
    }

    ASSERT_TRUE(sent && accepted);
    ASSERT_TRUE(*sent) << sent->error().what();
    EXPECT_EQ(sent->value(), transfer_outcome::cancelled);

    ASSERT_FALSE(*accepted);
    EXPECT_NE(accepted->error().message().find("cancelled by sender"), std::string::npos);

    // Stopped within a chunk boundary of the request.
    auto last = sender_progress->last();
    ASSERT_TRUE(last);
    EXPECT_LE(last->bytes_transferred, 3u * 256u);
    EXPECT_LT(received_data->size(), data.size());
}

TEST_F(TransferTest, CancelledBeforeStart)
{
    connect_pair();

    cancel_source cancel;
    cancel.cancel();
    send("abc", "a.txt", 3, cancel.token());
    request();
    run();

    ASSERT_TRUE(sent && requested);
    ASSERT_TRUE(*sent);
    EXPECT_EQ(sent->value(), transfer_outcome::cancelled);

    ASSERT_FALSE(*requested);
    EXPECT_EQ(requested->error().kind(), errc::transfer);
    EXPECT_FALSE(bob->pending_offer());
}

TEST_F(TransferTest, ReceiverCancelsBeforeOffer)
{
    connect_pair();

    cancel_source cancel;
    request(cancel.token());
    run();
    EXPECT_FALSE(requested);

    cancel.cancel();
    run();

    ASSERT_TRUE(requested && *requested);
    EXPECT_EQ(requested->value(), transfer_outcome::cancelled);
    EXPECT_FALSE(bob->pending_offer());
    EXPECT_EQ(bob->status(), session_status::consumed);
}

TEST_F(TransferTest, ReceiverCancelsMidTransfer)
{
    connect_pair();

    cancel_source cancel;
    auto data = pattern(64 * 1024);
    send(data, "big.bin", data.size());
    request();
    run();
    accept(cancel.token());

    io_context.restart();
    while (!(sent && accepted) && io_context.run_one())
    {
        if (!cancel.is_cancelled() && receiver_progress->size() >= 2)
            cancel.cancel();
    }

    ASSERT_TRUE(sent && accepted);
    ASSERT_TRUE(*accepted) << accepted->error().what();
    EXPECT_EQ(accepted->value(), transfer_outcome::cancelled);
    ASSERT_FALSE(*sent);
    EXPECT_EQ(sent->error().kind(), errc::transfer);
    EXPECT_NE(sent->error().what().find("cancelled by receiver"), std::string::npos) << sent->error().what();
}

TEST_F(TransferTest, PeerLeavesWithoutOffer)
{
    connect_pair();

    request();
    run();
    EXPECT_FALSE(requested);

    alice->destroy();
    run();

    ASSERT_TRUE(requested && *requested);
    EXPECT_EQ(requested->value(), transfer_outcome::completed);
    EXPECT_FALSE(bob->pending_offer());
}

TEST_F(TransferTest, DestroyDropsPendingOffer)
{
    connect_pair();

    send("abc", "a.txt", 3);
    request();
    run();
    ASSERT_TRUE(bob->pending_offer());

    bob->destroy();
    run();

    EXPECT_FALSE(bob->pending_offer());
    ASSERT_TRUE(sent);
    ASSERT_FALSE(*sent);
    EXPECT_EQ(sent->error().kind(), errc::transfer);
}

// Drives the receiver with a hand-written peer that sends more than it offered.
TEST_F(TransferTest, PeerSendsMoreThanOffered)
{
    channel::channel_ptr raw;
    {
        auto creator_config = app_config{};
        creator_config.application_id = "example.com/raw";
        std::optional<channel::welcome> welcome;
        channel::handshake_ptr creator, joiner;
        rendezvous->async_connect_without_code(creator_config, 2, [&](const boost::system::error_code&, channel::welcome w, channel::handshake_ptr h) {
            welcome = std::move(w);
            creator = std::move(h);
        });
        run();
        ASSERT_TRUE(welcome);
        rendezvous->async_connect_with_code(creator_config, welcome->code, [&](const boost::system::error_code&, channel::welcome, channel::handshake_ptr h) {
            joiner = std::move(h);
        });
        run();

        channel::channel_ptr receiver_side;
        creator->async_wait([&](const boost::system::error_code&, channel::channel_ptr c) { raw = std::move(c); });
        joiner->async_wait([&](const boost::system::error_code&, channel::channel_ptr c) { receiver_side = std::move(c); });
        run();
        ASSERT_TRUE(raw && receiver_side);

        auto messages = std::make_shared<message_channel>(io_context.get_executor(), receiver_side);
        offer_receiver::parameters params;
        std::make_shared<offer_receiver>(io_context, messages, params, [this](result<transfer_outcome> r, offer_ptr offer) {
            requested = std::move(r);
            pending = std::move(offer);
        })->start();
    }

    auto peer = std::make_shared<message_channel>(io_context.get_executor(), raw);
    peer->send(transit_request{}, [](result<void>) {});
    peer->send(file_offer{"small.bin", 4}, [](result<void>) {});
    run();

    ASSERT_TRUE(requested && *requested);
    ASSERT_TRUE(pending);

    pending->accept(std::make_unique<capturing_stream>(received_data), receiver_progress, {},
                    [this](result<transfer_outcome> r) { accepted = std::move(r); });

    file_chunk chunk;
    chunk.data.assign(8, 0xAB);
    peer->send(chunk, [](result<void>) {});
    run();

    ASSERT_TRUE(accepted);
    ASSERT_FALSE(*accepted);
    EXPECT_EQ(accepted->error().kind(), errc::transfer);
    EXPECT_TRUE(received_data->empty());

    const auto& metrics = peer->metrics();
    EXPECT_EQ(metrics.messages_sent.load(), 3u);
    EXPECT_EQ(metrics.messages_received.load(), 0u);
    EXPECT_GT(metrics.bytes_sent.load(), 3 * header_length);
    EXPECT_GE(metrics.uptime().count(), 0);
    EXPECT_LE(metrics.created_at, std::chrono::steady_clock::now());
}
