// micro-op queue and micro-op property checks

#include "MicroOp.h"
#include "test_util.h"

#include <cstring>

static void
testQueueOrder(TestCtx &t)
{
    MicroOpQueue q;
    t.ok(q.empty(), "new queue is empty");
    t.ok(!q.pop(), "pop of an empty queue fails");

    t.ok(q.push(uopInternal(2)), "push internal");
    t.ok(q.push(uop(uop_t::EXECUTE)), "push execute");
    t.ok(q.pushFront(uop(uop_t::FETCH_IRC)), "push fetch in front");

    t.eq(q.size(), 3, "three queued");
    t.ok(q.front().op == uop_t::FETCH_IRC, "front is the fetch");
    t.ok(q.at(1).op == uop_t::INTERNAL, "then the delay");
    t.eq(q.at(1).cycles, 2, "delay keeps its length");
    t.ok(q.at(2).op == uop_t::EXECUTE, "execute is last");

    t.ok(q.pop(), "pop");
    t.ok(q.front().op == uop_t::INTERNAL, "fetch is gone");

    q.clear();
    t.ok(q.empty(), "clear empties the queue");
}


static void
testQueueCapacity(TestCtx &t)
{
    MicroOpQueue q;
    for (int i=0; i < MicroOpQueue::CAPACITY; i++) {
        if (!q.push(uopInternal(i + 1))) {
            t.ok(false, "push below capacity");
            return;
        }
    }
    t.ok(!q.push(uop(uop_t::EXECUTE)), "push past capacity fails");
    t.ok(!q.pushFront(uop(uop_t::EXECUTE)), "pushFront past capacity fails");
    t.eq(q.size(), MicroOpQueue::CAPACITY, "full queue size");

    // wrap the ring a few times and check order survives
    for (int round=0; round < 3; round++) {
        for (int i=0; i < 5; i++) {
            (void)q.pop();
        }
        for (int i=0; i < 5; i++) {
            (void)q.push(uopInternal(100 + i));
        }
    }
    t.eq(q.size(), MicroOpQueue::CAPACITY, "still full after wrapping");
    t.eq(q.at(MicroOpQueue::CAPACITY - 1).cycles, 104, "last pushed is at the back");
    t.eq(q.front().cycles, 16, "oldest survivor at the front");
}


static void
testProperties(TestCtx &t)
{
    t.ok(uopIsInstant(uop(uop_t::EXECUTE)), "execute is instant");
    t.ok(uopIsInstant(uop(uop_t::ASSERT_RESET)), "reset pulse is instant");
    t.ok(uopIsInstant(uopInternal(0)), "zero delay is instant");
    t.ok(!uopIsInstant(uopInternal(1)), "one clock delay is timed");

    t.ok(uopIsBusCycle(uop(uop_t::FETCH_IRC)), "fetch is a bus cycle");
    t.ok(uopIsBusCycle(uop(uop_t::IACK, 3)), "iack is a bus cycle");
    t.ok(!uopIsBusCycle(uopInternal(4)), "delay isn't a bus cycle");

    t.eq(uopCycles(uopWrite(uop_t::WRITE_WORD, 0x1000, 0x1234)), 4, "bus cycle takes 4");
    t.eq(uopCycles(uopInternal(6)), 6, "delay takes its length");
    t.eq(uopCycles(uop(uop_t::EXECUTE)), 0, "execute takes nothing");

    const MicroOp rd = uopRead(uop_t::READ_WORD, 0x2000, true);
    t.ok((rd.flags & UOP_PROGRAM) != 0, "program read is flagged");
    t.eq(rd.addr, 0x2000, "read carries its address");

    t.ok(std::strcmp(uopName(uop_t::PUSH_LONG_HI), "PushLongHi") == 0, "op name");
}


int
main()
{
    TestCtx t("test_microop");
    testQueueOrder(t);
    testQueueCapacity(t);
    testProperties(t);
    return t.summary();
}

// vim: ts=8:et:sw=4:smarttab
