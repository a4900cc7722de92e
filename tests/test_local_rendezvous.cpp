#include <pylon/channel/local_rendezvous.hpp>
#include <pylon/channel/wordlist.hpp>
#include <pylon/common/helpers.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace pylon;
using namespace pylon::channel;

class LocalRendezvousTest : public ::testing::Test
{
  protected:
    struct connected_side
    {
        boost::system::error_code ec;
        welcome info;
        handshake_ptr handshake;
    };

    struct resolved_side
    {
        boost::system::error_code ec;
        channel_ptr channel;
    };

    void SetUp() override
    {
        rendezvous = std::make_shared<local_rendezvous>(io_context);
        rendezvous->seed(7);
    }

    connected_side create(std::size_t code_length = 2)
    {
        connected_side side;
        rendezvous->async_connect_without_code(config, code_length, [&](const boost::system::error_code& ec, welcome w, handshake_ptr h) {
            side = {ec, std::move(w), std::move(h)};
        });
        run();
        return side;
    }

    connected_side join(const std::string& code)
    {
        connected_side side;
        rendezvous->async_connect_with_code(config, code, [&](const boost::system::error_code& ec, welcome w, handshake_ptr h) {
            side = {ec, std::move(w), std::move(h)};
        });
        run();
        return side;
    }

    void wait(const handshake_ptr& handshake, std::optional<resolved_side>& out)
    {
        handshake->async_wait([&out](const boost::system::error_code& ec, channel_ptr channel) {
            out = resolved_side{ec, std::move(channel)};
        });
    }

    void run()
    {
        io_context.restart();
        io_context.run();
    }

    boost::asio::io_context io_context;
    std::shared_ptr<local_rendezvous> rendezvous;
    app_config config;
};

TEST_F(LocalRendezvousTest, CodeShape)
{
    auto side = create(3);

    ASSERT_FALSE(side.ec);
    ASSERT_TRUE(side.handshake);

    auto parts = split(side.info.code, '-');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "1");
    for (std::size_t i = 1; i < parts.size(); ++i)
        EXPECT_TRUE(is_code_word(parts[i])) << parts[i];

    EXPECT_EQ(rendezvous->open_nameplates(), 1u);
}

TEST_F(LocalRendezvousTest, LowestFreeNameplate)
{
    auto first = create();
    auto second = create();

    EXPECT_EQ(split(first.info.code, '-')[0], "1");
    EXPECT_EQ(split(second.info.code, '-')[0], "2");

    first.handshake->cancel();
    auto third = create();
    EXPECT_EQ(split(third.info.code, '-')[0], "1");

    config.application_id = "example.com/other";
    auto other_app = create();
    EXPECT_EQ(split(other_app.info.code, '-')[0], "1");
}

TEST_F(LocalRendezvousTest, MatchingCodesLinkChannels)
{
    rendezvous->set_motd("hello");
    auto creator = create();
    auto joiner = join(creator.info.code);

    ASSERT_FALSE(joiner.ec);
    EXPECT_EQ(joiner.info.motd, "hello");

    std::optional<resolved_side> a, b;
    wait(creator.handshake, a);
    wait(joiner.handshake, b);
    run();

    ASSERT_TRUE(a && b);
    ASSERT_FALSE(a->ec);
    ASSERT_FALSE(b->ec);
    EXPECT_EQ(rendezvous->open_nameplates(), 0u);

    std::vector<uint8_t> received;
    a->channel->async_send({1, 2, 3}, [](const boost::system::error_code& ec) { EXPECT_FALSE(ec); });
    b->channel->async_receive([&](const boost::system::error_code& ec, std::vector<uint8_t> message) {
        EXPECT_FALSE(ec);
        received = std::move(message);
    });
    run();

    EXPECT_EQ(received, (std::vector<uint8_t>{1, 2, 3}));
}

TEST_F(LocalRendezvousTest, ClosingNotifiesPeer)
{
    auto creator = create();
    auto joiner = join(creator.info.code);

    std::optional<resolved_side> a, b;
    wait(creator.handshake, a);
    wait(joiner.handshake, b);
    run();
    ASSERT_TRUE(a && b);

    // Messages sent before the close are still delivered.
    a->channel->async_send({9}, [](const boost::system::error_code&) {});
    a->channel->close();

    std::vector<boost::system::error_code> results;
    auto on_receive = [&](const boost::system::error_code& ec, std::vector<uint8_t>) { results.push_back(ec); };
    b->channel->async_receive(on_receive);
    run();
    b->channel->async_receive(on_receive);
    run();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0]);
    EXPECT_EQ(results[1], channel::errc::peer_closed);

    boost::system::error_code send_ec;
    b->channel->async_send({1}, [&](const boost::system::error_code& ec) { send_ec = ec; });
    run();
    EXPECT_EQ(send_ec, channel::errc::peer_closed);
}

TEST_F(LocalRendezvousTest, WrongWordsFailBothSides)
{
    auto creator = create();
    auto nameplate = split(creator.info.code, '-')[0];
    auto joiner = join(nameplate + "-wrong-words");

    std::optional<resolved_side> a, b;
    wait(creator.handshake, a);
    wait(joiner.handshake, b);
    run();

    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->ec, channel::errc::key_mismatch);
    EXPECT_EQ(b->ec, channel::errc::key_mismatch);
    EXPECT_EQ(rendezvous->open_nameplates(), 0u);
}

TEST_F(LocalRendezvousTest, JoinFailures)
{
    EXPECT_EQ(join("nonsense").ec, channel::errc::invalid_code);
    EXPECT_EQ(join("x-guitar-sailboat").ec, channel::errc::invalid_code);
    EXPECT_EQ(join("4-guitar-sailboat").ec, channel::errc::nameplate_unknown);

    auto creator = create();
    auto first = join(creator.info.code);
    ASSERT_FALSE(first.ec);

    // The exchange already ran, the nameplate is gone.
    EXPECT_EQ(join(creator.info.code).ec, channel::errc::nameplate_unknown);
}

TEST_F(LocalRendezvousTest, CrowdedNameplate)
{
    auto creator = create();

    connected_side first, second;
    rendezvous->async_connect_with_code(config, creator.info.code, [&](const boost::system::error_code& ec, welcome w, handshake_ptr h) {
        first = {ec, std::move(w), std::move(h)};
    });
    rendezvous->async_connect_with_code(config, creator.info.code, [&](const boost::system::error_code& ec, welcome w, handshake_ptr h) {
        second = {ec, std::move(w), std::move(h)};
    });
    run();

    EXPECT_FALSE(first.ec);
    EXPECT_EQ(second.ec, channel::errc::nameplate_crowded);
}

TEST_F(LocalRendezvousTest, OtherRendezvousUnreachable)
{
    config.rendezvous_url = "ws://unreachable.example.org:4000/v1";

    EXPECT_EQ(create().ec, channel::errc::rendezvous_unreachable);
    EXPECT_EQ(join("1-guitar-sailboat").ec, channel::errc::rendezvous_unreachable);
}

TEST_F(LocalRendezvousTest, CreatorCancelClosesJoiner)
{
    auto fresh = create();
    connected_side late;
    rendezvous->async_connect_with_code(config, fresh.info.code, [&](const boost::system::error_code& ec, welcome w, handshake_ptr h) {
        late = {ec, std::move(w), std::move(h)};
    });

    // Creator walks away before the key exchange runs.
    fresh.handshake->cancel();
    run();

    std::optional<resolved_side> outcome;
    ASSERT_TRUE(late.handshake);
    wait(late.handshake, outcome);
    run();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->ec, channel::errc::peer_closed);
}
