#include <unistd.h>

#include <array>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "core/asio_scheduler.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "net/asio_datagram_socket.hpp"
#include "net/beast_relay_socket.hpp"
#include "net/hybrid_transport.hpp"
#include "proto/client.hpp"
#include "proto/host.hpp"

namespace {

std::string render(const SimulationState &s) {
  std::vector<std::string> rows(s.height, std::string(s.width, '.'));
  auto put = [&](const Cell &c, char ch) {
    if (c.x >= 0 && c.y >= 0 && c.x < s.width && c.y < s.height) {
      rows[c.y][c.x] = ch;
    }
  };
  put(s.fruit, '*');
  for (const auto slot : kSlots) {
    const auto &actor = s.actor(slot);
    const char body = slot == Slot::First ? 'o' : 'x';
    const char head = slot == Slot::First ? 'O' : 'X';
    for (std::size_t i = 0; i < actor.body.size(); ++i) {
      put(actor.body[i], i == 0 ? head : body);
    }
  }

  std::ostringstream out;
  out << "\x1b[H\x1b[2J";
  for (const auto &row : rows) {
    out << row << '\n';
  }
  out << "first " << s.actor(Slot::First).score << "  second "
      << s.actor(Slot::Second).score << "  (to " << s.target_score << ")  "
      << to_string(s.status);
  if (s.winner) {
    out << "  winner: " << to_string(*s.winner);
  }
  out << '\n';
  return out.str();
}

// Wires one peer: relay + optional direct path underneath, Host or Client on
// top, keyboard on stdin.
class Peer {
public:
  Peer(boost::asio::io_context &io, PeerConfig cfg)
      : io_(io), cfg_(std::move(cfg)), sched_(io.get_executor()),
        input_(io, ::dup(STDIN_FILENO)), signals_(io, SIGINT, SIGTERM) {
    RelayOptions relay_opts;
    relay_opts.host = cfg_.host;
    relay_opts.port = cfg_.port;
    relay_opts.room = cfg_.room;
    relay_opts.slot = cfg_.slot;
    auto relay = std::make_shared<RelayChannel>(
        sched_, BeastRelaySocket::factory(io.get_executor()), relay_opts);

    auto make_socket = AsioDatagramSocket::factory(
        io.get_executor(), cfg_.udp_port, cfg_.advertise_host);
    DirectChannelFactory direct = [this, make_socket](ISignaling &signaling) {
      return std::make_shared<DirectChannel>(sched_, signaling, make_socket(),
                                             cfg_.slot);
    };

    HybridOptions hybrid_opts;
    hybrid_opts.negotiation_timeout =
        std::chrono::milliseconds(cfg_.negotiation_timeout_ms);
    hybrid_opts.enable_direct = cfg_.direct;
    transport_ = std::make_shared<HybridTransport>(sched_, std::move(relay),
                                                   direct, hybrid_opts);
    subs_.push_back(transport_->on_state_change([](ConnectionState s) {
      DUEL_LOGLN("transport: " << to_string(s));
    }));

    auto on_state = [](const SimulationState &s) { std::cout << render(s); };
    auto on_error = [this](const DuelError &err) {
      DUEL_LOGLN(to_string(err.kind()) << ": " << err.what());
      if (err.fatal()) {
        shutdown();
      }
    };

    if (cfg_.slot == Slot::First) {
      HostOptions host_opts;
      host_opts.engine.width = cfg_.width;
      host_opts.engine.height = cfg_.height;
      host_opts.engine.target_score = cfg_.target_score;
      host_opts.engine.tick_interval_ms = cfg_.tick_ms;
      host_opts.engine.seed = cfg_.seed;
      host_ = std::make_unique<AuthorityHost>(sched_, host_opts);
      subs_.push_back(host_->on_state(on_state));
      subs_.push_back(host_->on_error(on_error));
      host_->attach(transport_);
    } else {
      client_ = std::make_unique<AuthorityClient>(sched_);
      subs_.push_back(client_->on_state(on_state));
      subs_.push_back(client_->on_error(on_error));
      client_->attach(transport_);
    }
  }

  void start() {
    std::cout << "room " << cfg_.room << " as " << to_string(cfg_.slot)
              << ", press r then Enter when ready\n";
    signals_.async_wait(
        [this](const boost::system::error_code &, int) { shutdown(); });
    transport_->connect();
    read_key();
  }

private:
  void read_key() {
    input_.async_read_some(
        boost::asio::buffer(key_),
        [this](const boost::system::error_code &ec, std::size_t n) {
          if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
              DUEL_LOGLN("stdin: " << ec.message());
            }
            return;
          }
          for (std::size_t i = 0; i < n; ++i) {
            on_key(key_[i]);
          }
          if (!stopped_) {
            read_key();
          }
        });
  }

  void on_key(char c) {
    switch (c) {
    case 'w':
      steer(Direction::Up);
      break;
    case 's':
      steer(Direction::Down);
      break;
    case 'a':
      steer(Direction::Left);
      break;
    case 'd':
      steer(Direction::Right);
      break;
    case 'r':
      if (host_) {
        host_->mark_ready();
      } else {
        client_->mark_ready();
      }
      break;
    case 'q':
      shutdown();
      break;
    default:
      break;
    }
  }

  void steer(Direction dir) {
    if (host_) {
      host_->queue_local_intent(dir);
    } else {
      client_->send_input(dir);
    }
  }

  void shutdown() {
    if (stopped_) {
      return;
    }
    stopped_ = true;
    subs_.clear();
    if (host_) {
      host_->dispose();
    }
    if (client_) {
      client_->dispose();
    }
    transport_->dispose();
    boost::system::error_code ignored;
    input_.cancel(ignored);
    signals_.cancel(ignored);
    io_.stop();
  }

  boost::asio::io_context &io_;
  PeerConfig cfg_;
  AsioScheduler sched_;
  boost::asio::posix::stream_descriptor input_;
  boost::asio::signal_set signals_;
  std::shared_ptr<HybridTransport> transport_;
  std::unique_ptr<AuthorityHost> host_;
  std::unique_ptr<AuthorityClient> client_;
  std::vector<Subscription> subs_;
  std::array<char, 64> key_{};
  bool stopped_ = false;
};

} // namespace

int main(int argc, char **argv) {
  try {
    auto cfg = load_peer_config(argc, argv);
    if (cfg.help) {
      std::cout << peer_usage();
      return 0;
    }

    boost::asio::io_context io;
    Peer peer(io, std::move(cfg));
    peer.start();
    io.run();

    return 0;

  } catch (const std::invalid_argument &e) {
    std::cerr << "error: " << e.what() << "\n" << peer_usage();
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}
