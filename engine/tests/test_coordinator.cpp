#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "agentswarm/engine/coordinator.hpp"

using namespace agentswarm::engine;

class CountingActor : public Actor {
public:
    explicit CountingActor(const std::string& id, size_t capacity = 100)
        : Actor(id, nullptr, nullptr, capacity) {}

    ~CountingActor() override {
        auto res = stop();
        assert(res);
    }

    Result process_task(const Task& task) override {
        std::lock_guard<std::mutex> lock(mu_);
        seen_.push_back(task.id);
        return Result::ok_result(task.id, id() + " handled " + task.id);
    }

    std::vector<std::string> seen() const {
        std::lock_guard<std::mutex> lock(mu_);
        return seen_;
    }

private:
    mutable std::mutex mu_;
    std::vector<std::string> seen_;
};

static Task make_task(const std::string& id) {
    Task task;
    task.id = id;
    task.description = "task " + id;
    return task;
}

static bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

void test_register_and_duplicate() {
    std::cout << "Testing actor registration..." << std::endl;

    Coordinator coord;
    auto a1 = std::make_shared<CountingActor>("a1");
    assert(coord.register_actor(a1));
    assert(coord.size() == 1);
    // Registration attaches the coordinator's bus but does not start the actor
    assert(a1->event_bus() == &coord.event_bus());
    assert(a1->state() == ActorState::idle);

    auto impostor = std::make_shared<CountingActor>("a1");
    auto res = coord.register_actor(impostor);
    assert(!res);
    assert(is(res.error(), swarm_errc::duplicate_id));
    assert(coord.size() == 1);
    assert(coord.list_actors() == std::vector<std::string>{"a1"});

    auto null_res = coord.register_actor(nullptr);
    assert(!null_res);
    assert(is(null_res.error(), swarm_errc::invalid_argument));

    std::cout << "✓ Actor registration test passed" << std::endl;
}

void test_deregister() {
    std::cout << "Testing deregister..." << std::endl;

    Coordinator coord;
    auto a1 = std::make_shared<CountingActor>("a1");
    auto a2 = std::make_shared<CountingActor>("a2");
    assert(coord.register_actor(a1));
    assert(coord.register_actor(a2));
    assert(coord.start_all(CancellationScope::make_root()));

    assert(coord.deregister("a1"));
    assert(a1->state() == ActorState::stopped);
    assert(coord.size() == 1);
    assert(coord.list_actors() == std::vector<std::string>{"a2"});

    auto missing = coord.deregister("a1");
    assert(!missing);
    assert(is(missing.error(), swarm_errc::not_found));

    // Routing continues over the remaining actor
    auto chosen = coord.distribute(make_task("t1"));
    assert(chosen && *chosen == "a2");

    assert(coord.stop_all());
    std::cout << "✓ Deregister test passed" << std::endl;
}

void test_round_robin_distribution() {
    std::cout << "Testing round-robin distribution..." << std::endl;

    Coordinator coord;
    for (const auto& id : {"a1", "a2", "a3"}) {
        assert(coord.register_actor(std::make_shared<CountingActor>(id)));
    }

    std::vector<std::string> assigned;
    for (int i = 0; i < 6; ++i) {
        auto chosen = coord.distribute(make_task("t" + std::to_string(i)));
        assert(chosen);
        assigned.push_back(*chosen);
    }
    std::vector<std::string> expected = {"a1", "a2", "a3", "a1", "a2", "a3"};
    assert(assigned == expected);

    std::cout << "✓ Round-robin distribution test passed" << std::endl;
}

void test_distribute_skips_stopped() {
    std::cout << "Testing distribution skips stopped actors..." << std::endl;

    Coordinator coord;
    auto a1 = std::make_shared<CountingActor>("a1");
    auto a2 = std::make_shared<CountingActor>("a2");
    auto a3 = std::make_shared<CountingActor>("a3");
    assert(coord.register_actor(a1));
    assert(coord.register_actor(a2));
    assert(coord.register_actor(a3));

    assert(a2->stop());
    for (int i = 0; i < 4; ++i) {
        auto chosen = coord.distribute(make_task("t" + std::to_string(i)));
        assert(chosen);
        assert(*chosen != "a2");
    }

    assert(a1->stop());
    assert(a3->stop());
    auto none = coord.distribute(make_task("orphan"));
    assert(!none);
    assert(is(none.error(), swarm_errc::no_available_actor));

    std::cout << "✓ Distribution skips stopped actors test passed" << std::endl;
}

void test_distribute_empty_registry() {
    std::cout << "Testing distribution with no actors..." << std::endl;

    Coordinator coord;
    auto res = coord.distribute(make_task("t1"));
    assert(!res);
    assert(is(res.error(), swarm_errc::no_available_actor));

    std::cout << "✓ Distribution with no actors test passed" << std::endl;
}

void test_distribute_surfaces_mailbox_full() {
    std::cout << "Testing distribution surfaces mailbox_full..." << std::endl;

    Coordinator coord;
    assert(coord.register_actor(std::make_shared<CountingActor>("a1", 1)));

    assert(coord.distribute(make_task("t1")));
    auto res = coord.distribute(make_task("t2"));
    assert(!res);
    assert(is(res.error(), swarm_errc::mailbox_full));

    std::cout << "✓ Distribution surfaces mailbox_full test passed" << std::endl;
}

void test_broadcast_aggregates_failures() {
    std::cout << "Testing broadcast..." << std::endl;

    Coordinator coord;
    auto a1 = std::make_shared<CountingActor>("a1");
    auto a2 = std::make_shared<CountingActor>("a2");
    auto a3 = std::make_shared<CountingActor>("a3", 1);
    assert(coord.register_actor(a1));
    assert(coord.register_actor(a2));
    assert(coord.register_actor(a3));

    Message msg;
    msg.sender = "test";
    msg.type = MessageType::task;
    msg.payload = BroadcastPayload{"config", {{"verbose", true}}};
    assert(coord.broadcast(msg));

    // Every actor got a copy tagged as a broadcast
    for (const auto& actor : {a1, a2, a3}) {
        auto received = actor->try_receive();
        assert(received);
        assert(received->type == MessageType::broadcast);
        assert(received->recipient == actor->id());
        assert(std::get<BroadcastPayload>(received->payload).topic == "config");
    }

    // One stopped, one full: both reported, the healthy actor still receives
    assert(a2->stop());
    assert(a3->send(Message::for_task("test", "a3", make_task("filler"))));
    auto res = coord.broadcast(msg);
    assert(!res);
    assert(is(res.error(), swarm_errc::multiple_failures));
    auto context = error_context(res.error());
    assert(context.find("a2") != std::string::npos);
    assert(context.find("a3") != std::string::npos);
    assert(context.find("a1:") == std::string::npos);
    assert(a1->pending_messages() == 1);

    std::cout << "✓ Broadcast test passed" << std::endl;
}

void test_direct_send() {
    std::cout << "Testing direct send..." << std::endl;

    Coordinator coord;
    auto a1 = std::make_shared<CountingActor>("a1");
    assert(coord.register_actor(a1));

    assert(coord.send("tester", "a1", Message::for_task("", "", make_task("t1"))));
    auto received = a1->try_receive();
    assert(received);
    assert(received->sender == "tester");
    assert(received->recipient == "a1");

    auto res = coord.send("tester", "ghost", Message::for_task("", "", make_task("t2")));
    assert(!res);
    assert(is(res.error(), swarm_errc::not_found));

    std::cout << "✓ Direct send test passed" << std::endl;
}

void test_status_snapshot() {
    std::cout << "Testing status snapshot..." << std::endl;

    Coordinator coord;
    auto a1 = std::make_shared<CountingActor>("a1");
    auto a2 = std::make_shared<CountingActor>("a2");
    assert(coord.register_actor(a1));
    assert(coord.register_actor(a2));

    auto idle = coord.status();
    assert(idle.size() == 2);
    assert(idle["a1"] == ActorState::idle);

    assert(coord.start_all(CancellationScope::make_root()));
    assert(a2->stop());
    auto mixed = coord.status();
    assert(mixed["a1"] == ActorState::processing);
    assert(mixed["a2"] == ActorState::stopped);

    assert(coord.stop_all());
    for (const auto& entry : coord.status()) {
        assert(entry.second == ActorState::stopped);
    }

    std::cout << "✓ Status snapshot test passed" << std::endl;
}

void test_start_all_reports_failures() {
    std::cout << "Testing start_all failure aggregation..." << std::endl;

    Coordinator coord;
    auto a1 = std::make_shared<CountingActor>("a1");
    auto a2 = std::make_shared<CountingActor>("a2");
    assert(coord.register_actor(a1));
    assert(coord.register_actor(a2));
    assert(a1->stop());

    auto res = coord.start_all(CancellationScope::make_root());
    assert(!res);
    assert(is(res.error(), swarm_errc::multiple_failures));
    // Partial starts stay running
    assert(a2->state() == ActorState::processing);

    assert(coord.stop_all());
    std::cout << "✓ start_all failure aggregation test passed" << std::endl;
}

void test_end_to_end_distribution() {
    std::cout << "Testing end-to-end distribution..." << std::endl;

    Coordinator coord;
    auto sub = coord.event_bus().subscribe();
    std::vector<std::shared_ptr<CountingActor>> actors;
    for (const auto& id : {"a1", "a2", "a3"}) {
        actors.push_back(std::make_shared<CountingActor>(id));
        assert(coord.register_actor(actors.back()));
    }
    assert(coord.start_all(CancellationScope::make_root()));

    std::map<std::string, std::string> assignment;
    for (int i = 1; i <= 5; ++i) {
        auto id = "t" + std::to_string(i);
        auto chosen = coord.distribute(make_task(id));
        assert(chosen);
        assignment[id] = *chosen;
    }

    std::map<std::string, std::string> completed_by;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (completed_by.size() < 5 && std::chrono::steady_clock::now() < deadline) {
        auto event = sub->receive_for(std::chrono::milliseconds(50));
        if (event && event->kind == EventKind::task_completed) {
            // Each task completes exactly once
            assert(completed_by.count(event->task_id) == 0);
            completed_by[event->task_id] = event->actor_id;
        }
    }
    assert(completed_by == assignment);

    size_t handled = 0;
    std::set<std::string> unique;
    for (const auto& actor : actors) {
        for (const auto& id : actor->seen()) {
            unique.insert(id);
            handled++;
        }
    }
    assert(handled == 5);
    assert(unique.size() == 5);

    for (const auto& entry : coord.status()) {
        assert(entry.second == ActorState::processing);
    }

    assert(coord.stop_all());
    assert(wait_until([&] {
        for (const auto& entry : coord.status()) {
            if (entry.second != ActorState::stopped) {
                return false;
            }
        }
        return true;
    }));

    std::cout << "✓ End-to-end distribution test passed" << std::endl;
}

void test_get_actor() {
    std::cout << "Testing actor lookup..." << std::endl;

    Coordinator coord;
    auto a1 = std::make_shared<CountingActor>("a1");
    assert(coord.register_actor(a1));

    auto found = coord.get_actor("a1");
    assert(found);
    assert(*found == a1);
    assert((*found)->id() == "a1");

    auto missing = coord.get_actor("ghost");
    assert(!missing);
    assert(is(missing.error(), swarm_errc::not_found));

    // Gone once deregistered
    assert(coord.deregister("a1"));
    assert(!coord.get_actor("a1"));

    std::cout << "✓ Actor lookup test passed" << std::endl;
}

int main() {
    std::cout << "Running coordinator tests..." << std::endl;

    test_register_and_duplicate();
    test_deregister();
    test_round_robin_distribution();
    test_distribute_skips_stopped();
    test_distribute_empty_registry();
    test_distribute_surfaces_mailbox_full();
    test_broadcast_aggregates_failures();
    test_direct_send();
    test_status_snapshot();
    test_start_all_reports_failures();
    test_end_to_end_distribution();
    test_get_actor();

    std::cout << "All coordinator tests passed!" << std::endl;
    return 0;
}
