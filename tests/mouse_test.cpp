#include <assert.h>
#include <string.h>

#include "fake_8042.hpp"
#include <drivers/mouse/mouse.hpp>

using namespace i8042::drivers::mouse;

static void test_every_byte_routed_to_mouse() {
    FakeBus bus;
    Mouse mouse(bus.controller);
    const uint8_t acks[] = { 0xFA, 0xFA };
    bus.sim.Queue(acks, 2);
    assert(mouse.SetSampleRate(100).IsOk());

    // 0xD4, 0xF3, 0xD4, 0x64
    assert(bus.sim.traceCount == 4);
    assert(bus.sim.trace[0].command && bus.sim.trace[0].value == PS2_CMD_WRITE_TO_MOUSE);
    assert(bus.sim.trace[1].toMouse && bus.sim.trace[1].value == MOUSE_CMD_SET_SAMPLE_RATE);
    assert(bus.sim.trace[2].command && bus.sim.trace[2].value == PS2_CMD_WRITE_TO_MOUSE);
    assert(bus.sim.trace[3].toMouse && bus.sim.trace[3].value == 100);
}

static void test_resolution_sent_as_index() {
    const uint8_t counts[] = { 1, 2, 4, 8 };
    for (uint8_t i = 0; i < 4; ++i) {
        FakeBus bus;
        Mouse mouse(bus.controller);
        const uint8_t acks[] = { 0xFA, 0xFA };
        bus.sim.Queue(acks, 2);
        assert(mouse.SetResolution(counts[i]).IsOk());
        uint8_t bytes[4];
        bool toMouse[4];
        assert(bus.sim.DataWrites(bytes, toMouse) == 2);
        assert(bytes[0] == MOUSE_CMD_SET_RESOLUTION && bytes[1] == i);
        assert(toMouse[0] && toMouse[1]);
    }
}

static void test_invalid_parameters_send_nothing() {
    FakeBus bus;
    Mouse mouse(bus.controller);

    MouseError err = mouse.SetResolution(5);
    assert(err.kind == MouseError::INVALID_RESOLUTION && err.response == 5);
    err = mouse.SetResolution(0);
    assert(err.kind == MouseError::INVALID_RESOLUTION);

    err = mouse.SetSampleRate(15);
    assert(err.kind == MouseError::INVALID_SAMPLE_RATE && err.response == 15);
    err = mouse.SetSampleRate(0);
    assert(err.kind == MouseError::INVALID_SAMPLE_RATE);

    assert(bus.sim.Writes() == 0);
}

static void test_table_helpers() {
    uint8_t value = 0;
    assert(Mouse::ResolutionToIndex(8, value) && value == 3);
    assert(!Mouse::ResolutionToIndex(3, value));
    assert(Mouse::IndexToResolution(2, value) && value == 4);
    assert(!Mouse::IndexToResolution(4, value));

    const uint8_t valid[] = { 10, 20, 40, 60, 80, 100, 200 };
    for (unsigned i = 0; i < sizeof(valid); ++i) assert(Mouse::IsValidSampleRate(valid[i]));
    assert(!Mouse::IsValidSampleRate(30));
    assert(!Mouse::IsValidSampleRate(255));
}

static void test_decode_packet() {
    MousePacket p = Mouse::DecodePacket(0x10, 0xFF, 0x01);
    assert(p.x == -1);
    assert(p.y == 1);

    p = Mouse::DecodePacket(0x00, 0xFF, 0xFF);
    assert(p.x == 255 && p.y == 255);

    p = Mouse::DecodePacket(MOUSE_MOVE_X_SIGN | MOUSE_MOVE_Y_SIGN, 0x00, 0x80);
    assert(p.x == -256);
    assert(p.y == -128);

    // bit 3 is always one on the wire and is not part of the layout
    p = Mouse::DecodePacket(0x09, 0x05, 0x00);
    assert(p.flags.Bits() == MOUSE_MOVE_LEFT_BUTTON);
    assert(p.flags.Contains(MOUSE_MOVE_LEFT_BUTTON));
    assert(!p.flags.Contains(MOUSE_MOVE_RIGHT_BUTTON));
    assert(p.x == 5);
}

static void test_request_data_packet() {
    FakeBus bus;
    Mouse mouse(bus.controller);
    const uint8_t reply[] = { 0xFA, 0x28, 0x03, 0xFE };
    bus.sim.Queue(reply, 4);
    MousePacket p;
    assert(mouse.RequestDataPacket(p).IsOk());
    assert(p.x == 3);
    assert(p.y == -2);
    assert(bus.sim.Last().toMouse && bus.sim.Last().value == MOUSE_CMD_READ_DATA);
}

static void test_read_pending_packet_writes_nothing() {
    FakeBus bus;
    Mouse mouse(bus.controller);
    const uint8_t packet[] = { 0x0A, 0x10, 0x20 };
    bus.sim.Queue(packet, 3);
    MousePacket p;
    assert(mouse.ReadDataPacket(p).IsOk());
    assert(p.flags.Contains(MOUSE_MOVE_RIGHT_BUTTON));
    assert(p.x == 0x10 && p.y == 0x20);
    assert(bus.sim.Writes() == 0);

    // partial packet
    bus.sim.Queue(0x08);
    MouseError err = mouse.ReadDataPacket(p);
    assert(err.kind == MouseError::CONTROLLER);
    assert(err.controller.kind == ControllerError::TIMEOUT);
}

static void test_status_packet() {
    FakeBus bus;
    Mouse mouse(bus.controller);
    const uint8_t reply[] = { 0xFA, 0x2C, 0x02, 100 };
    bus.sim.Queue(reply, 4);
    MouseStatusPacket status;
    assert(mouse.GetStatusPacket(status).IsOk());
    assert(status.status.Contains(MOUSE_STATUS_LEFT_BUTTON | MOUSE_STATUS_DATA_REPORTING));
    assert(!status.status.Contains(MOUSE_STATUS_REMOTE_MODE));
    assert(status.status.Bits() == 0x24);
    assert(status.resolution == 4);
    assert(status.sampleRate == 100);

    const uint8_t badResolution[] = { 0xFA, 0x00, 0x07, 100 };
    bus.sim.Queue(badResolution, 4);
    MouseError err = mouse.GetStatusPacket(status);
    assert(err.kind == MouseError::INVALID_RESOLUTION && err.response == 7);

    const uint8_t badRate[] = { 0xFA, 0x00, 0x00, 33 };
    bus.sim.Queue(badRate, 4);
    err = mouse.GetStatusPacket(status);
    assert(err.kind == MouseError::INVALID_SAMPLE_RATE && err.response == 33);
}

static void test_mouse_type() {
    struct Case { uint8_t id; MouseType::Kind kind; };
    const Case cases[] = {
        { 0x00, MouseType::STANDARD },
        { 0x03, MouseType::INTELLIMOUSE },
        { 0x04, MouseType::INTELLIMOUSE_EXPLORER },
        { 0x08, MouseType::TYPHOON },
        { 0x42, MouseType::UNKNOWN },
    };
    for (unsigned i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i) {
        FakeBus bus;
        Mouse mouse(bus.controller);
        bus.sim.Queue(0xFA);
        bus.sim.Queue(cases[i].id);
        MouseType type;
        assert(mouse.GetMouseType(type).IsOk());
        assert(type.kind == cases[i].kind);
        assert(type.id == cases[i].id);
    }
}

static void test_handshake_errors() {
    {
        FakeBus bus;
        Mouse mouse(bus.controller);
        bus.sim.Queue(0xFE);
        MouseError err = mouse.EnableDataReporting();
        assert(err.kind == MouseError::RESEND && err.response == 0xFE);
    }
    {
        // 0x00 and 0xFF are only special for the keyboard
        FakeBus bus;
        Mouse mouse(bus.controller);
        bus.sim.Queue(0x00);
        assert(mouse.DisableDataReporting().kind == MouseError::INVALID_RESPONSE);
        bus.sim.Queue(0xFF);
        assert(mouse.SetDefaults().kind == MouseError::INVALID_RESPONSE);
    }
    {
        FakeBus bus;
        Mouse mouse(bus.controller);
        MouseError err = mouse.SetStreamMode();
        assert(err.kind == MouseError::CONTROLLER);
        assert(err.controller.kind == ControllerError::TIMEOUT);
    }
}

static void test_simple_commands() {
    FakeBus bus;
    Mouse mouse(bus.controller);
    for (int i = 0; i < 8; ++i) bus.sim.Queue(0xFA);
    assert(mouse.SetScalingOneToOne().IsOk());
    assert(mouse.SetScalingTwoToOne().IsOk());
    assert(mouse.SetStreamMode().IsOk());
    assert(mouse.SetRemoteMode().IsOk());
    assert(mouse.SetWrapMode().IsOk());
    assert(mouse.ResetWrapMode().IsOk());
    assert(mouse.EnableDataReporting().IsOk());
    assert(mouse.SetDefaults().IsOk());

    uint8_t bytes[16];
    bool toMouse[16];
    const uint8_t expected[] = { 0xE6, 0xE7, 0xEA, 0xF0, 0xEE, 0xEC, 0xF4, 0xF6 };
    assert(bus.sim.DataWrites(bytes, toMouse) == 8);
    assert(memcmp(bytes, expected, sizeof(expected)) == 0);
    for (int i = 0; i < 8; ++i) assert(toMouse[i]);
}

static void test_resend_last_packet() {
    FakeBus bus;
    Mouse mouse(bus.controller);
    const uint8_t packet[] = { 0x08, 0x01, 0x02 };
    bus.sim.Queue(packet, 3);
    uint8_t first = 0;
    assert(mouse.ResendLastPacket(first).IsOk());
    assert(first == 0x08);
    assert(bus.sim.Pending() == 2);
    assert(bus.sim.Last().toMouse && bus.sim.Last().value == MOUSE_CMD_RESEND);

    FakeBus refused;
    Mouse other(refused.controller);
    refused.sim.Queue(0xFE);
    assert(other.ResendLastPacket(first).kind == MouseError::RESEND);
}

static void test_reset_drains_device_id() {
    {
        FakeBus bus;
        Mouse mouse(bus.controller);
        const uint8_t reply[] = { 0xFA, 0xAA, 0x00 };
        bus.sim.Queue(reply, 3);
        assert(mouse.ResetAndSelfTest().IsOk());
        assert(bus.sim.Pending() == 0);
    }
    {
        FakeBus bus;
        Mouse mouse(bus.controller);
        const uint8_t reply[] = { 0xFA, 0xFC, 0x00 };
        bus.sim.Queue(reply, 3);
        MouseError err = mouse.ResetAndSelfTest();
        assert(err.kind == MouseError::SELF_TEST_FAILED && err.response == 0xFC);
        assert(bus.sim.Pending() == 0);
    }
    {
        FakeBus bus;
        Mouse mouse(bus.controller);
        const uint8_t reply[] = { 0xFA, 0xFE, 0x00 };
        bus.sim.Queue(reply, 3);
        MouseError err = mouse.ResetAndSelfTest();
        assert(err.kind == MouseError::RESEND && err.response == 0xFE);
        assert(bus.sim.Pending() == 0);
    }
    {
        FakeBus bus;
        Mouse mouse(bus.controller);
        const uint8_t reply[] = { 0xFA, 0x42, 0x00 };
        bus.sim.Queue(reply, 3);
        MouseError err = mouse.ResetAndSelfTest();
        assert(err.kind == MouseError::INVALID_RESPONSE && err.response == 0x42);
        assert(bus.sim.Pending() == 0);
    }
    {
        // missing ID byte outranks the self-test result
        FakeBus bus;
        Mouse mouse(bus.controller);
        const uint8_t reply[] = { 0xFA, 0xFC };
        bus.sim.Queue(reply, 2);
        MouseError err = mouse.ResetAndSelfTest();
        assert(err.kind == MouseError::CONTROLLER);
        assert(err.controller.kind == ControllerError::TIMEOUT);
    }
}

static void test_busy_controller() {
    FakeBus bus;
    Mouse mouse(bus.controller);
    ControllerLease held(bus.controller);
    MousePacket p;
    MouseError err = mouse.ReadDataPacket(p);
    assert(err.kind == MouseError::CONTROLLER);
    assert(err.controller.kind == ControllerError::BUSY);
    assert(mouse.SetSampleRate(15).kind == MouseError::INVALID_SAMPLE_RATE);
    assert(mouse.SetDefaults().controller.kind == ControllerError::BUSY);
    assert(bus.sim.Writes() == 0);
    assert(bus.sim.statusReads == 0);
}

int main() {
    test_every_byte_routed_to_mouse();
    test_resolution_sent_as_index();
    test_invalid_parameters_send_nothing();
    test_table_helpers();
    test_decode_packet();
    test_request_data_packet();
    test_read_pending_packet_writes_nothing();
    test_status_packet();
    test_mouse_type();
    test_handshake_errors();
    test_simple_commands();
    test_resend_last_packet();
    test_reset_drains_device_id();
    test_busy_controller();
    return 0;
}
