// Sends a file between two sessions sharing an in-process rendezvous.
//
//   local_transfer [file]
//
// Without an argument a generated 1 MiB buffer is sent.

#include <pylon/pylon.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

int main(int argc, char* argv[])
{
    try
    {
        std::unique_ptr<std::istream> source;
        std::string file_name = "generated.bin";
        uint64_t file_size = 1024 * 1024;

        if (argc > 1)
        {
            auto file = std::make_unique<std::ifstream>(argv[1], std::ios::binary | std::ios::ate);
            if (!*file)
            {
                std::cerr << "Cannot open " << argv[1] << std::endl;
                return 1;
            }
            file_size = static_cast<uint64_t>(file->tellg());
            file->seekg(0);
            file_name = argv[1];
            source = std::move(file);
        }
        else
        {
            source = std::make_unique<std::istringstream>(std::string(file_size, 'p'));
        }

        std::cout << pylon::version_full() << std::endl;

        boost::asio::io_context io;
        auto rendezvous = std::make_shared<pylon::channel::local_rendezvous>(io);
        rendezvous->set_motd("local rendezvous, nothing leaves this process");

        auto config = pylon::app_config::from_env();
        config.rendezvous_url = rendezvous->url();

        auto sender = pylon::session_builder{}.with_config(config).build(io, rendezvous);
        auto receiver = pylon::session_builder{}.with_config(config).build(io, rendezvous);

        auto sender_progress = std::make_shared<pylon::progress_queue>();
        auto receiver_progress = std::make_shared<pylon::progress_queue>();
        auto received = std::make_shared<uint64_t>(0);

        sender->generate_code(2, [&](pylon::result<std::string> code) {
            if (!code)
            {
                std::cerr << code.error().what() << std::endl;
                return;
            }

            std::cout << "Wormhole code is: " << code.value() << std::endl;
            if (!sender->motd().empty())
                std::cout << "Rendezvous: " << sender->motd() << std::endl;

            receiver->connect_with_code(code.value(), [&](pylon::result<void> joined) {
                if (!joined)
                    std::cerr << joined.error().what() << std::endl;
            });

            sender->wait_connected([&](pylon::result<void> connected) {
                if (!connected)
                {
                    std::cerr << connected.error().what() << std::endl;
                    return;
                }

                sender->send_file(std::move(source), file_name, file_size, sender_progress, {}, [&](pylon::result<pylon::transfer_outcome> outcome) {
                    if (!outcome)
                        std::cerr << "send: " << outcome.error().what() << std::endl;
                    else
                        std::cout << "send: " << pylon::to_string(outcome.value()) << std::endl;
                });

                receiver->request_file({}, [&](pylon::result<pylon::transfer_outcome> outcome) {
                    auto offer = receiver->pending_offer();
                    if (!outcome || !offer)
                    {
                        std::cerr << "request: no offer received" << std::endl;
                        return;
                    }

                    std::cout << "Receiving '" << offer->file_name() << "' (" << offer->file_size() << " bytes)" << std::endl;
                    offer->accept(std::make_unique<std::ostringstream>(), receiver_progress, {}, [&, offer](pylon::result<pylon::transfer_outcome> accepted) {
                        if (!accepted)
                        {
                            std::cerr << "receive: " << accepted.error().what() << std::endl;
                            return;
                        }
                        *received = offer->bytes_received();
                    });
                });
            });
        });

        io.run();

        for (const auto& event : receiver_progress->drain())
            std::cout << "  " << event.bytes_transferred << "/" << event.total_bytes << std::endl;

        std::cout << "Received " << *received << " of " << file_size << " bytes" << std::endl;
        return *received == file_size ? 0 : 1;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
