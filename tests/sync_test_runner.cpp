#include "connection.hpp"
#include "content_hasher.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "sync_node.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using lansync::test::TempDir;
using lansync::test::TestCase;
using lansync::test::TestContext;
using lansync::test::count_staging_files;
using lansync::test::loopback_settings;
using lansync::test::patterned_bytes;
using lansync::test::read_file;
using lansync::test::wait_for_condition;
using lansync::test::write_file;

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

std::filesystem::path shared_dir(const TempDir& root, const std::string& name) {
  return root.path() / name / "shared";
}

// Node rooted at <root>/<name>, serving <root>/<name>/shared. Not started.
std::unique_ptr<SyncNode> make_node(TestContext& ctx,
                                    const TempDir& root,
                                    const std::string& name,
                                    const nlohmann::json& overrides = nlohmann::json::object()) {
  auto workspace = root.path() / name;
  std::filesystem::create_directories(workspace / "shared");
  nlohmann::json settings_doc = {{"block_size", 1024}, {"sync_interval", 3600}};
  for(const auto& item : overrides.items()) {
    settings_doc[item.key()] = item.value();
  }
  SyncNode::Options options;
  options.workspace_root = workspace;
  options.local_ip = "127.0.0.1";
  auto node = std::make_unique<SyncNode>(loopback_settings(workspace, settings_doc), options);
  ctx.logs.attach(*node, name);
  return node;
}

bool same_file(const std::filesystem::path& a, const std::filesystem::path& b) {
  return std::filesystem::exists(a) && std::filesystem::exists(b) &&
         hash_file(a, 4096) == hash_file(b, 4096);
}

bool test_new_file_reaches_static_peer(TestContext& ctx) {
  TempDir root("scenario1");
  write_file(shared_dir(root, "a") / "a.txt", "hello");

  auto a = make_node(ctx, root, "a");
  a->start();
  auto b = make_node(ctx, root, "b", {{"peers", "127.0.0.1:" + std::to_string(a->listen_port())}});
  b->start();

  // admission of the static peer triggers an immediate sync, no cycle wait
  bool ok = wait_for_condition([&]{
    return read_file(shared_dir(root, "b") / "a.txt") == "hello";
  }, 10s);
  ok = ok && hash_file(shared_dir(root, "b") / "a.txt", 1024) == hash_bytes("hello");
  ok = ok && b->stats().known_peers == 1;
  ok = ok && count_staging_files(shared_dir(root, "b")) == 0;

  b->stop();
  a->stop();
  return ok;
}

bool conflict_converges(TestContext& ctx, bool initiated_by_a) {
  TempDir root(initiated_by_a ? "scenario2a" : "scenario2b");
  const std::string content_a = "version written on A";
  const std::string content_b = "version written on B, different";
  write_file(shared_dir(root, "a") / "shared.bin", content_a);
  write_file(shared_dir(root, "b") / "shared.bin", content_b);
  const auto& winner = hash_bytes(content_a) > hash_bytes(content_b) ? content_a : content_b;

  auto a = make_node(ctx, root, "a");
  auto b = make_node(ctx, root, "b");
  a->start();
  b->start();

  auto& initiator = initiated_by_a ? *a : *b;
  auto& responder = initiated_by_a ? *b : *a;
  auto first = initiator.sync_now(responder.self_address());
  bool ok = !first.failed && first.pulled + first.pushed == 1;
  ok = ok && read_file(shared_dir(root, "a") / "shared.bin") == winner;
  ok = ok && read_file(shared_dir(root, "b") / "shared.bin") == winner;

  // the losing side now holds the winning content, nothing flows back
  auto reverse = responder.sync_now(initiator.self_address());
  ok = ok && !reverse.failed && reverse.pulled == 0 && reverse.pushed == 0;
  ok = ok && read_file(shared_dir(root, "a") / "shared.bin") == winner;

  b->stop();
  a->stop();
  return ok;
}

bool test_conflict_greater_hash_wins(TestContext& ctx) {
  return conflict_converges(ctx, true) && conflict_converges(ctx, false);
}

bool test_interrupted_push_leaves_nothing(TestContext& ctx) {
  TempDir root("scenario3");
  const auto content = patterned_bytes(10 * kMiB, 11);
  write_file(shared_dir(root, "a") / "file.bin", content);

  auto a = make_node(ctx, root, "a", {{"block_size", static_cast<int>(kMiB)}});
  auto b = make_node(ctx, root, "b", {{"block_size", static_cast<int>(kMiB)}});
  a->start();
  b->start();

  {
    // announce 10 MiB, deliver 5 MiB, drop the connection
    Connection conn(std::chrono::milliseconds(5000));
    auto target = b->self_address();
    conn.connect(target.host, target.port, std::chrono::milliseconds(5000));
    conn.write_line(format_prepare_request("file.bin", content.size()));
    if(conn.read_line(kMaxRequestLine) != kReadyToken) return false;
    conn.write(content.data(), 5 * kMiB);
    conn.close();
  }

  bool ok = wait_for_condition([&]{ return b->server().stats().pushes_failed == 1; }, 10s);
  ok = ok && !std::filesystem::exists(shared_dir(root, "b") / "file.bin");
  ok = ok && count_staging_files(shared_dir(root, "b")) == 0;
  ok = ok && b->index().snapshot().count("file.bin") == 0;

  // the next cycle re-attempts and completes
  auto report = a->sync_now(b->self_address());
  ok = ok && !report.failed && report.pushed == 1;
  ok = ok && read_file(shared_dir(root, "b") / "file.bin") == content;
  ok = ok && count_staging_files(shared_dir(root, "b")) == 0;

  b->stop();
  a->stop();
  return ok;
}

bool test_large_listing_is_complete(TestContext& ctx) {
  TempDir root("scenario4");
  const int file_count = 10000;
  char name[32];
  for(int i = 0; i < file_count; ++i) {
    std::snprintf(name, sizeof(name), "file-%05d.txt", i);
    write_file(shared_dir(root, "a") / name, std::to_string(i));
  }

  auto a = make_node(ctx, root, "a", {{"transfer_timeout", 60}});
  auto b = make_node(ctx, root, "b", {{"transfer_timeout", 60}});
  a->start();
  b->start();

  auto listing = b->client().fetch_listing(a->self_address());
  bool ok = listing.size() == static_cast<std::size_t>(file_count);
  ok = ok && listing.count("file-00000.txt") == 1 && listing.count("file-09999.txt") == 1;
  ok = ok && listing["file-04242.txt"].hash == hash_bytes("4242");

  b->stop();
  a->stop();
  return ok;
}

bool test_zero_byte_pull(TestContext& ctx) {
  TempDir root("scenario5");
  write_file(shared_dir(root, "a") / "empty.txt", "");

  auto a = make_node(ctx, root, "a");
  auto b = make_node(ctx, root, "b");
  a->start();
  b->start();

  auto report = b->sync_now(a->self_address());
  auto target = shared_dir(root, "b") / "empty.txt";
  bool ok = !report.failed && report.pulled == 1;
  ok = ok && std::filesystem::exists(target) && std::filesystem::file_size(target) == 0;
  ok = ok && b->client().stats().chunk_requests == 0;
  ok = ok && a->server().stats().chunks_served == 0;

  b->stop();
  a->stop();
  return ok;
}

bool test_resync_is_idempotent(TestContext& ctx) {
  TempDir root("idempotence");
  write_file(shared_dir(root, "a") / "one.txt", "1");
  write_file(shared_dir(root, "a") / "big.bin", patterned_bytes(5000, 2));
  write_file(shared_dir(root, "b") / "two.txt", "22");
  write_file(shared_dir(root, "b") / "three.txt", "333");

  auto a = make_node(ctx, root, "a");
  auto b = make_node(ctx, root, "b");
  a->start();
  b->start();

  auto first = a->sync_now(b->self_address());
  bool ok = !first.failed && first.pulled == 2 && first.pushed == 2;
  for(const char* name : {"one.txt", "big.bin", "two.txt", "three.txt"}) {
    ok = ok && same_file(shared_dir(root, "a") / name, shared_dir(root, "b") / name);
  }

  auto before = a->client().stats();
  auto second = a->sync_now(b->self_address());
  auto after = a->client().stats();
  ok = ok && !second.failed && second.pulled == 0 && second.pushed == 0;
  ok = ok && after.pulls == before.pulls && after.pushes == before.pushes &&
       after.chunk_requests == before.chunk_requests;

  auto reverse = b->sync_now(a->self_address());
  ok = ok && !reverse.failed && reverse.pulled == 0 && reverse.pushed == 0;
  ok = ok && a->ledger().size() == 4;

  b->stop();
  a->stop();
  return ok;
}

bool test_only_changed_file_moves(TestContext& ctx) {
  TempDir root("unrelated_change");
  write_file(shared_dir(root, "a") / "x.txt", "x version 1");
  write_file(shared_dir(root, "a") / "y.txt", "y stays");
  write_file(shared_dir(root, "a") / "z.txt", "z stays");

  auto a = make_node(ctx, root, "a");
  auto b = make_node(ctx, root, "b");
  a->start();
  b->start();

  auto first = b->sync_now(a->self_address());
  bool ok = !first.failed && first.pulled == 3;

  // pick an edit whose hash outranks the old one, so the edit wins the tie-break
  const auto old_hash = hash_bytes("x version 1");
  std::string edited;
  for(int revision = 2; edited.empty() || hash_bytes(edited) < old_hash; ++revision) {
    edited = "x version " + std::to_string(revision);
  }
  write_file(shared_dir(root, "a") / "x.txt", edited);
  a->index().invalidate();
  auto second = b->sync_now(a->self_address());
  ok = ok && !second.failed && second.pulled == 1 && second.pushed == 0 && second.skipped == 0;
  ok = ok && read_file(shared_dir(root, "b") / "x.txt") == edited;
  ok = ok && read_file(shared_dir(root, "b") / "y.txt") == "y stays";

  b->stop();
  a->stop();
  return ok;
}

bool test_three_nodes_converge(TestContext& ctx) {
  TempDir root("three_nodes");
  const std::vector<std::string> names = {"a", "b", "c"};
  for(const auto& n : names) {
    write_file(shared_dir(root, n) / (n + ".txt"), "from " + n);
  }
  write_file(shared_dir(root, "a") / "both.txt", "older text from a");
  write_file(shared_dir(root, "c") / "both.txt", "text from c");

  std::vector<std::unique_ptr<SyncNode>> nodes;
  for(const auto& n : names) {
    nodes.push_back(make_node(ctx, root, n, {{"sync_interval", 1}, {"scan_interval", 1}}));
    nodes.back()->start();
  }
  for(auto& node : nodes) {
    for(auto& other : nodes) {
      if(node != other) node->registry().admit(other->self_address());
    }
  }

  auto converged = [&]{
    for(const auto& file : {"a.txt", "b.txt", "c.txt", "both.txt"}) {
      auto reference = hash_file(shared_dir(root, "a") / file, 4096);
      if(reference.empty()) return false;
      for(const auto& n : names) {
        if(hash_file(shared_dir(root, n) / file, 4096) != reference) return false;
      }
    }
    return true;
  };
  bool ok = wait_for_condition(converged, 20s, 100ms);

  const auto winner = std::max(hash_bytes("older text from a"), hash_bytes("text from c"));
  ok = ok && hash_file(shared_dir(root, "b") / "both.txt", 4096) == winner;

  for(auto& node : nodes) node->stop();
  return ok;
}

bool test_unreachable_peer_is_isolated(TestContext& ctx) {
  TempDir root("isolation");
  write_file(shared_dir(root, "a") / "a.txt", "hello");
  auto a = make_node(ctx, root, "a");
  auto b = make_node(ctx, root, "b", {{"connect_timeout", 1}});
  a->start();
  b->start();

  uint16_t dead_port = 0;
  {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    dead_port = acceptor.local_endpoint().port();
  }
  auto failed = b->sync_now(PeerAddress{"127.0.0.1", dead_port});
  auto good = b->sync_now(a->self_address());
  bool ok = failed.failed && !failed.error.empty();
  ok = ok && !good.failed && good.pulled == 1;
  ok = ok && b->stats().reconciler.peer_failures == 1;
  ok = ok && ctx.logs.contains("abandoned");

  b->stop();
  a->stop();
  return ok;
}

bool test_long_names_transfer(TestContext& ctx) {
  TempDir root("long_names");
  const std::string pulled_name = std::string(246, 'p') + ".bin";
  const std::string pushed_name = std::string(246, 'q') + ".txt";
  const auto pulled_content = patterned_bytes(3000, 5);
  write_file(shared_dir(root, "a") / pulled_name, pulled_content);
  write_file(shared_dir(root, "b") / pushed_name, "pushed from b");
  write_file(shared_dir(root, "a") / "short.txt", "after the long ones");

  auto a = make_node(ctx, root, "a");
  auto b = make_node(ctx, root, "b");
  a->start();
  b->start();

  auto report = b->sync_now(a->self_address());
  bool ok = !report.failed && report.pulled == 2 && report.pushed == 1;
  ok = ok && read_file(shared_dir(root, "b") / pulled_name) == pulled_content;
  ok = ok && read_file(shared_dir(root, "a") / pushed_name) == "pushed from b";
  ok = ok && read_file(shared_dir(root, "b") / "short.txt") == "after the long ones";
  ok = ok && count_staging_files(shared_dir(root, "a")) == 0;
  ok = ok && count_staging_files(shared_dir(root, "b")) == 0;

  b->stop();
  a->stop();
  return ok;
}

bool test_invalid_settings_fail_startup(TestContext& ctx) {
  TempDir root("bad_settings");
  auto node = make_node(ctx, root, "a", {{"shared_dir", ""}});
  try {
    node->start();
  } catch(const std::runtime_error&) {
    return !node->running();
  }
  return false;
}

bool test_stop_is_prompt(TestContext& ctx) {
  TempDir root("shutdown");
  auto a = make_node(ctx, root, "a", {{"sync_interval", 1}});
  a->start();
  bool ok = a->running();
  auto started = std::chrono::steady_clock::now();
  a->stop();
  auto elapsed = std::chrono::steady_clock::now() - started;
  ok = ok && !a->running() && elapsed < 5s;
  a->stop();
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"new_file_reaches_static_peer", test_new_file_reaches_static_peer},
    {"conflict_greater_hash_wins", test_conflict_greater_hash_wins},
    {"interrupted_push_leaves_nothing", test_interrupted_push_leaves_nothing},
    {"large_listing_is_complete", test_large_listing_is_complete},
    {"zero_byte_pull", test_zero_byte_pull},
    {"resync_is_idempotent", test_resync_is_idempotent},
    {"only_changed_file_moves", test_only_changed_file_moves},
    {"three_nodes_converge", test_three_nodes_converge},
    {"unreachable_peer_is_isolated", test_unreachable_peer_is_isolated},
    {"long_names_transfer", test_long_names_transfer},
    {"invalid_settings_fail_startup", test_invalid_settings_fail_startup},
    {"stop_is_prompt", test_stop_is_prompt},
  };
  return lansync::test::run_test_table("sync", tests, argc, argv);
}
