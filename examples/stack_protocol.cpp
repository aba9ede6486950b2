// Example request/response exchange - a bounded stack server
// Demonstrates closed variants as message roots and a shared PicklerCache
#include <pickler/cache.hpp>
#include <pickler/inspect.hpp>
#include "stack_types.hpp"
#include "stack_types_generated.hpp"

#include <fmt/format.h>
#include <iostream>
#include <string>
#include <type_traits>
#include <vector>

namespace {

constexpr size_t MAX_ITEMS = 3;

// Server side: decode a command, apply it, encode the response
class StackServer {
public:
    explicit StackServer(pickler::PicklerCache& cache)
        : commands_(cache.get<stack::Command>()),
          responses_(cache.get<stack::Response>()) {}

    std::vector<uint8_t> handle(std::span<const uint8_t> request) {
        stack::Command command = commands_->decode(request);
        stack::Response response = std::visit([this](const auto& c) { return apply(c); }, command);
        return responses_->encode(response);
    }

private:
    std::shared_ptr<const pickler::Pickler<stack::Command>> commands_;
    std::shared_ptr<const pickler::Pickler<stack::Response>> responses_;
    std::vector<std::string> items_;

    stack::Response apply(const stack::Push& push) {
        if (items_.size() >= MAX_ITEMS) {
            return stack::Failure{stack::ErrorCode::Full, fmt::format("cannot push '{}'", push.item)};
        }
        items_.push_back(push.item);
        return stack::Success{std::nullopt};
    }

    stack::Response apply(const stack::Pop&) {
        if (items_.empty()) {
            return stack::Failure{stack::ErrorCode::Empty, "nothing to pop"};
        }
        std::string top = std::move(items_.back());
        items_.pop_back();
        return stack::Success{std::move(top)};
    }

    stack::Response apply(const stack::Peek&) {
        if (items_.empty()) {
            return stack::Failure{stack::ErrorCode::Empty, "nothing to peek"};
        }
        return stack::Success{items_.back()};
    }
};

std::string describe(const stack::Command& command) {
    return std::visit([](const auto& c) -> std::string {
        using C = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<C, stack::Push>) {
            return fmt::format("PUSH {}", c.item);
        } else if constexpr (std::is_same_v<C, stack::Pop>) {
            return "POP";
        } else {
            return "PEEK";
        }
    }, command);
}

std::string describe(const stack::Response& response) {
    if (const auto* ok = std::get_if<stack::Success>(&response)) {
        return ok->value ? fmt::format("ok {}", *ok->value) : "ok";
    }
    const auto& failure = std::get<stack::Failure>(response);
    return fmt::format("error {} ({})", static_cast<int>(failure.code), failure.reason);
}

} // anonymous namespace

int main() {
    try {
        pickler::PicklerCache cache;
        StackServer server(cache);
        auto commands = cache.get<stack::Command>();
        auto responses = cache.get<stack::Response>();

        const std::vector<stack::Command> script = {
            stack::Peek{},
            stack::Push{"alpha"},
            stack::Push{"beta"},
            stack::Push{"gamma"},
            stack::Push{"delta"},
            stack::Peek{},
            stack::Pop{},
            stack::Pop{},
            stack::Pop{},
            stack::Pop{}
        };

        size_t request_bytes = 0;
        size_t response_bytes = 0;
        for (const auto& command : script) {
            auto request = commands->encode(command);
            auto reply = server.handle(request);
            request_bytes += request.size();
            response_bytes += reply.size();

            stack::Response response = responses->decode(reply);
            std::cout << fmt::format("{:<12} -> {:<30} [{} / {} bytes]\n",
                                     describe(command), describe(response),
                                     request.size(), reply.size());
        }

        std::cout << fmt::format("\n{} requests, {} request bytes, {} response bytes\n",
                                 script.size(), request_bytes, response_bytes);

        std::cout << "\nLast failure on the wire:\n";
        std::cout << pickler::inspect(responses->encode(
            stack::Failure{stack::ErrorCode::Empty, "nothing to pop"}));
    } catch (const pickler::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
