#include <iostream>
#include <fstream>
#include <string>
#include "beast_transport.hpp"
#include "client_config.hpp"
#include "mesh_client.hpp"
#include "payload_source.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.textproto> <command>\n"
              << "Commands:\n"
              << "  --handshake\n"
              << "  --count\n"
              << "  --list\n"
              << "  --send <recipient> <file> [--subject <text>] [--workflow <id>]\n"
              << "  --receive <message_id> <output_file> [--ack]\n"
              << "  --receive-all <output_dir> [--ack]\n"
              << "  --ack <message_id>\n"
              << "  --track <local_id>\n"
              << "  --lookup <organisation> <workflow_id>\n"
              << "  --token" << std::endl;
}

int send_file(meshlink::MeshClient& client, int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: " << argv[0] << " <config> --send <recipient> <file> [--subject <text>] [--workflow <id>]"
                  << std::endl;
        return 1;
    }
    std::string recipient = argv[3];
    std::string file_path = argv[4];

    meshlink::MessageMetadata metadata;
    std::size_t slash = file_path.find_last_of('/');
    metadata.filename = slash == std::string::npos ? file_path : file_path.substr(slash + 1);
    for (int i = 5; i + 1 < argc; i += 2) {
        std::string flag = argv[i];
        if (flag == "--subject") {
            metadata.subject = std::string(argv[i + 1]);
        } else if (flag == "--workflow") {
            metadata.workflow_id = std::string(argv[i + 1]);
        } else {
            std::cerr << "Unknown option " << flag << std::endl;
            return 1;
        }
    }

    std::string message_id = client.send_message(recipient, meshlink::payload_from_file(file_path), metadata);
    std::cout << message_id << std::endl;
    return 0;
}

// Writes the message body to `path`; false when the file could not be written
bool save_message(meshlink::ReceivedMessage& message, const std::string& path) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "Could not open " << path << " for writing" << std::endl;
        return false;
    }

    uint64_t written = 0;
    for (meshlink::Bytes block = message.read(meshlink::DEFAULT_BLOCK_SIZE); !block.empty();
         block = message.read(meshlink::DEFAULT_BLOCK_SIZE)) {
        out.write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(block.size()));
        written += block.size();
    }
    out.close();
    if (!out) {
        std::cerr << "Failed writing " << path << std::endl;
        return false;
    }
    std::cout << "Wrote " << written << " bytes to " << path << std::endl;
    return true;
}

int receive_file(meshlink::MeshClient& client, int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: " << argv[0] << " <config> --receive <message_id> <output_file> [--ack]" << std::endl;
        return 1;
    }
    bool acknowledge = argc > 5 && std::string(argv[5]) == "--ack";

    auto message = client.retrieve_message(argv[3]);
    if (!save_message(*message, argv[4])) {
        return 1;
    }
    if (acknowledge) {
        message->acknowledge();
    }
    return 0;
}

int receive_all(meshlink::MeshClient& client, int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <config> --receive-all <output_dir> [--ack]" << std::endl;
        return 1;
    }
    std::string dir = argv[3];
    bool acknowledge = argc > 4 && std::string(argv[4]) == "--ack";

    int failures = 0;
    client.iterate_all_messages([&](meshlink::ReceivedMessage& message) {
        if (!save_message(message, dir + "/" + message.id())) {
            ++failures;
            return;
        }
        if (acknowledge) {
            message.acknowledge();
        }
    });
    return failures == 0 ? 0 : 1;
}

void print_tracking(const meshlink::TrackingInfo& info) {
    std::cout << "message_id: " << info.message_id << "\n"
              << "local_id: " << info.local_id << "\n"
              << "status: " << info.status << " (" << info.status_code << ")\n"
              << "status_event: " << info.status_event << "\n"
              << "status_timestamp: " << info.status_timestamp << "\n"
              << "sender: " << info.sender << "\n"
              << "recipient: " << info.recipient << std::endl;
}

}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        meshlink::ClientOptions options = meshlink::load_client_options(argv[1]);
        std::string command = argv[2];

        if (command == "--token") {
            // Prints one Authorization value, for poking the server by hand
            meshlink::AuthTokenGenerator auth({options.shared_key, options.mailbox, options.password});
            std::cout << auth.generate() << std::endl;
            return 0;
        }

        auto transport = std::make_unique<meshlink::BeastTransport>(options.url, options.tls);
        meshlink::MeshClient client(std::move(transport), options);

        if (command == "--handshake") {
            client.handshake();
        } else if (command == "--count") {
            std::cout << client.count_messages() << std::endl;
        } else if (command == "--list") {
            for (const auto& id : client.list_messages()) {
                std::cout << id << std::endl;
            }
        } else if (command == "--send") {
            return send_file(client, argc, argv);
        } else if (command == "--receive") {
            return receive_file(client, argc, argv);
        } else if (command == "--ack") {
            if (argc < 4) {
                std::cerr << "Usage: " << argv[0] << " <config> --ack <message_id>" << std::endl;
                return 1;
            }
            client.acknowledge_message(argv[3]);
        } else if (command == "--receive-all") {
            return receive_all(client, argc, argv);
        } else if (command == "--track") {
            if (argc < 4) {
                std::cerr << "Usage: " << argv[0] << " <config> --track <local_id>" << std::endl;
                return 1;
            }
            print_tracking(client.get_tracking_info(argv[3]));
        } else if (command == "--lookup") {
            if (argc < 5) {
                std::cerr << "Usage: " << argv[0] << " <config> --lookup <organisation> <workflow_id>" << std::endl;
                return 1;
            }
            for (const auto& endpoint : client.lookup_endpoint(argv[3], argv[4]).results) {
                std::cout << endpoint.address << "\t" << endpoint.endpoint_type << "\t"
                          << endpoint.description << std::endl;
            }
        } else {
            print_usage(argv[0]);
            return 1;
        }
    } catch (std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
