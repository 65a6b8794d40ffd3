#include <assert.h>
#include <string.h>

#include "fake_8042.hpp"

static void test_ram_address_masked_into_opcode() {
    FakeBus bus;
    for (unsigned n = 0; n <= 32; ++n) {
        uint8_t value = 0xEE;
        ControllerError err = bus.controller.ReadInternalRam((uint8_t)n, value);
        assert(err.IsOk());
        const TraceEntry& last = bus.sim.Last();
        assert(last.command);
        assert(last.value == (0x20 | (n & 0x1F)));

        err = bus.controller.WriteInternalRam((uint8_t)n, (uint8_t)n);
        assert(err.IsOk());
        // opcode, then the data byte
        assert(bus.sim.trace[bus.sim.traceCount - 2].command);
        assert(bus.sim.trace[bus.sim.traceCount - 2].value == (0x60 | (n & 0x1F)));
        assert(!bus.sim.Last().command);
    }
    // address 32 wrapped onto byte 0
    assert(bus.sim.ram[0] == 32);
}

static void test_config_round_trip_truncates_undefined_bits() {
    FakeBus bus;
    ControllerConfig config = ControllerConfig::FromBitsTruncate(0xFF);
    assert(config.Bits() == 0x77);
    assert(ControllerConfig::All().Bits() == 0x77);

    assert(bus.controller.WriteConfig(config).IsOk());
    assert(bus.sim.ram[0] == 0x77);

    ControllerConfig readBack;
    assert(bus.controller.ReadConfig(readBack).IsOk());
    assert(readBack == config);

    // hardware reporting stray bits never leaks them
    bus.sim.ram[0] = 0x88 | PS2_CONFIG_ENABLE_TRANSLATE;
    assert(bus.controller.ReadConfig(readBack).IsOk());
    assert(readBack.Bits() == PS2_CONFIG_ENABLE_TRANSLATE);

    assert(ControllerInput::FromBitsTruncate(0xFF).Bits() == 0xF3);
    assert(ControllerOutput::FromBitsTruncate(0).Bits() == 0);
    assert(MouseMovement::FromBitsTruncate(0xFF).Bits() == 0xF7);
    assert(KeyboardLeds::FromBitsTruncate(0xFF).Bits() == 0x07);

    ControllerConfig edited;
    edited.Insert(0x08 | PS2_CONFIG_DISABLE_MOUSE);
    assert(edited.Bits() == PS2_CONFIG_DISABLE_MOUSE);
    edited.Set(PS2_CONFIG_DISABLE_MOUSE, false);
    assert(edited.IsEmpty());
}

static void test_controller_self_test() {
    {
        FakeBus bus;
        bus.sim.Queue(0x55);
        assert(bus.controller.TestController().IsOk());
        assert(bus.sim.Last().command && bus.sim.Last().value == PS2_CMD_TEST_CONTROLLER);
    }
    const uint8_t failures[] = { 0x54, 0x00, 0xFC };
    for (unsigned i = 0; i < sizeof(failures); ++i) {
        FakeBus bus;
        bus.sim.Queue(failures[i]);
        ControllerError err = bus.controller.TestController();
        assert(err.kind == ControllerError::TEST_FAILED);
        assert(err.response == failures[i]);
    }
}

static void test_port_self_tests() {
    FakeBus bus;
    bus.sim.Queue(0x00);
    assert(bus.controller.TestKeyboard().IsOk());
    bus.sim.Queue(0x00);
    assert(bus.controller.TestMouse().IsOk());
    assert(bus.sim.trace[0].value == PS2_CMD_TEST_KEYBOARD);
    assert(bus.sim.trace[1].value == PS2_CMD_TEST_MOUSE);

    bus.sim.Queue(0x02);    // data line stuck low
    ControllerError err = bus.controller.TestKeyboard();
    assert(err.kind == ControllerError::TEST_FAILED && err.response == 0x02);

    // no reply at all is a timeout, not a failed test
    err = bus.controller.TestMouse();
    assert(err.kind == ControllerError::TIMEOUT);
}

static void test_read_times_out_after_bounded_polls() {
    FakeBus bus;
    uint8_t data = 0;
    ControllerError err = bus.controller.ReadData(data);
    assert(err.kind == ControllerError::TIMEOUT);
    assert(bus.sim.statusReads == (int)FakeBus::TEST_TIMEOUT);
    assert(bus.sim.dataReads == 0);
}

static void test_write_times_out_when_input_stays_full() {
    FakeBus bus;
    bus.sim.inputFull = true;
    assert(bus.controller.WriteData(0x12).kind == ControllerError::TIMEOUT);
    assert(bus.controller.WriteCommand(PS2_CMD_ENABLE_KEYBOARD).kind == ControllerError::TIMEOUT);
    assert(bus.controller.PulseOutputLowNibble(0x0E).kind == ControllerError::TIMEOUT);
    assert(bus.sim.Writes() == 0);
}

static void test_non_blocking_read() {
    FakeBus bus;
    assert(bus.controller.IsBlockingRead());
    bus.controller.DisableBlockingRead();

    uint8_t data = 0;
    ControllerError err = bus.controller.ReadData(data);
    assert(err.kind == ControllerError::WOULD_BLOCK);
    assert(bus.sim.statusReads == 1);

    bus.sim.Queue(0x1C);
    assert(bus.controller.ReadData(data).IsOk());
    assert(data == 0x1C);

    bus.controller.EnableBlockingRead();
    assert(bus.controller.ReadData(data).kind == ControllerError::TIMEOUT);
}

static void test_diagnostic_dump_reads_32_bytes() {
    FakeBus bus;
    for (int i = 0; i < 32; ++i) bus.sim.Queue((uint8_t)(0xC0 + i));
    uint8_t dump[PS2_RAM_SIZE];
    assert(bus.controller.DiagnosticDump(dump).IsOk());
    for (int i = 0; i < 32; ++i) assert(dump[i] == 0xC0 + i);
    assert(bus.sim.Pending() == 0);

    // short dump surfaces the timeout
    FakeBus shortBus;
    shortBus.sim.Queue(0x01);
    assert(shortBus.controller.DiagnosticDump(dump).kind == ControllerError::TIMEOUT);
}

static void test_ports_and_buffers() {
    FakeBus bus;
    bus.sim.Queue(0xFF);
    ControllerInput input;
    assert(bus.controller.ReadInputPort(input).IsOk());
    assert(input.Bits() == 0xF3);

    bus.sim.Queue(PS2_OUTPUT_SYSTEM_RESET | PS2_OUTPUT_A20_GATE);
    ControllerOutput output;
    assert(bus.controller.ReadOutputPort(output).IsOk());
    assert(output.Contains(PS2_OUTPUT_A20_GATE));

    bus.sim.Queue(0xFF);
    ControllerTestPort test;
    assert(bus.controller.ReadTestPort(test).IsOk());
    assert(test.Bits() == 0x03);

    bus.sim.traceCount = 0;
    assert(bus.controller.WriteOutputPort(output).IsOk());
    assert(bus.sim.trace[0].command && bus.sim.trace[0].value == PS2_CMD_WRITE_OUTPUT_PORT);
    assert(!bus.sim.trace[1].command && bus.sim.trace[1].value == 0x03);

    bus.sim.traceCount = 0;
    assert(bus.controller.WriteKeyboardBuffer(0x1E).IsOk());
    assert(bus.controller.WriteMouseBuffer(0x08).IsOk());
    assert(bus.controller.WriteToMouse(0xF4).IsOk());
    assert(bus.sim.traceCount == 6);
    assert(bus.sim.trace[0].value == PS2_CMD_WRITE_KEYBOARD_BUFFER && bus.sim.trace[1].value == 0x1E);
    assert(bus.sim.trace[2].value == PS2_CMD_WRITE_MOUSE_BUFFER && bus.sim.trace[3].value == 0x08);
    assert(bus.sim.trace[4].value == PS2_CMD_WRITE_TO_MOUSE);
    assert(bus.sim.trace[5].toMouse && bus.sim.trace[5].value == 0xF4);

    bus.sim.traceCount = 0;
    assert(bus.controller.EnableKeyboard().IsOk());
    assert(bus.controller.DisableKeyboard().IsOk());
    assert(bus.controller.EnableMouse().IsOk());
    assert(bus.controller.DisableMouse().IsOk());
    assert(bus.controller.WriteInputLowNibbleToStatus().IsOk());
    assert(bus.controller.WriteInputHighNibbleToStatus().IsOk());
    const uint8_t expected[] = { 0xAE, 0xAD, 0xA8, 0xA7, 0xC1, 0xC2 };
    for (int i = 0; i < 6; ++i) {
        assert(bus.sim.trace[i].command);
        assert(bus.sim.trace[i].value == expected[i]);
    }
}

static void test_pulse_output_keeps_high_nibble_set() {
    FakeBus bus;
    assert(bus.controller.PulseOutputLowNibble(0x0E).IsOk());
    assert(bus.sim.Last().command && bus.sim.Last().value == 0xFE);
    assert(bus.controller.PulseOutputLowNibble(0x3A).IsOk());
    assert(bus.sim.Last().value == 0xFA);
    assert(bus.controller.PulseOutputLowNibble(0x00).IsOk());
    assert(bus.sim.Last().value == 0xF0);
}

static void test_flush_output() {
    FakeBus bus;
    assert(bus.controller.FlushOutput() == 0);
    bus.sim.Queue(0xAA);
    bus.sim.Queue(0x00);
    assert(bus.controller.FlushOutput() == 2);
    assert(bus.sim.Pending() == 0);

    // bounded by the timeout even if the chip never drains
    for (int i = 0; i < 40; ++i) bus.sim.Queue(0x01);
    assert(bus.controller.FlushOutput() == FakeBus::TEST_TIMEOUT);
}

static void test_lease_is_exclusive_and_released() {
    FakeBus bus;
    {
        ControllerLease first(bus.controller);
        assert(first.Acquired());
        ControllerLease second(bus.controller);
        assert(!second.Acquired());
    }
    ControllerLease again(bus.controller);
    assert(again.Acquired());
}

static void test_timeout_is_configurable() {
    FakeBus bus;
    bus.controller.SetTimeout(3);
    assert(bus.controller.Timeout() == 3);
    uint8_t data = 0;
    assert(bus.controller.ReadData(data).kind == ControllerError::TIMEOUT);
    assert(bus.sim.statusReads == 3);
    assert(strcmp(ControllerError::Timeout().Name(), "timeout") == 0);
}

int main() {
    test_ram_address_masked_into_opcode();
    test_config_round_trip_truncates_undefined_bits();
    test_controller_self_test();
    test_port_self_tests();
    test_read_times_out_after_bounded_polls();
    test_write_times_out_when_input_stays_full();
    test_non_blocking_read();
    test_diagnostic_dump_reads_32_bytes();
    test_ports_and_buffers();
    test_pulse_output_keeps_high_nibble_set();
    test_flush_output();
    test_lease_is_exclusive_and_released();
    test_timeout_is_configurable();
    return 0;
}
