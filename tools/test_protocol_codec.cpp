// test_protocol_codec.cpp - Unit test for streaming and discrete encoders
//
// Tests:
// 1. Streaming tokens for every command
// 2. Out-of-set commands become the stop-all unit
// 3. Listener program handles every token
// 4. Discrete programs carry motion, dwell and a closing stop
// 5. Mode names and command parsing

#include "session/protocol_codec.hpp"
#include <iostream>
#include <string>

using namespace hubdrive;
using namespace hubdrive::session;

static int g_pass = 0, g_fail = 0;

static void expect(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        g_pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        g_fail++;
    }
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

int main() {
    std::cout << "=== Protocol Codec Unit Test ===\n\n";

    DriveTuning tuning;

    // ========================================================================
    // TEST 1: Streaming tokens
    // ========================================================================
    std::cout << "TEST 1: Streaming tokens\n";
    {
        StreamingCodec codec(tuning);
        const struct {
            DriveCommand cmd;
            char token;
        } table[] = {
            {DriveCommand::Forward, 'F'},  {DriveCommand::Turbo, 'T'},
            {DriveCommand::Backward, 'B'}, {DriveCommand::TurnLeft, 'L'},
            {DriveCommand::TurnRight, 'R'}, {DriveCommand::Center, 'C'},
            {DriveCommand::Stop, 'S'},     {DriveCommand::Shutdown, 'X'},
        };
        for (const auto& row : table) {
            WireUnit unit = codec.encode(row.cmd);
            bool ok = !unit.isProgram() && unit.token.size() == 1 &&
                      unit.token[0] == static_cast<uint8_t>(row.token) && !unit.fallback;
            expect(ok, std::string(driveCommandToString(row.cmd)) + " -> " + row.token);
        }
        WireUnit shutdown = codec.shutdownUnit();
        expect(shutdown.token.size() == 1 && shutdown.token[0] == 'X', "shutdown unit is X");
        expect(codec.mode() == ProtocolMode::Streaming, "mode is Streaming");
    }

    // ========================================================================
    // TEST 2: Out-of-set input
    // ========================================================================
    std::cout << "\nTEST 2: Out-of-set commands\n";
    {
        DriveCommand bogus = static_cast<DriveCommand>(42);
        expect(!isValidDriveCommand(bogus), "42 is not a drive command");

        StreamingCodec streaming(tuning);
        WireUnit s = streaming.encode(bogus);
        expect(s.fallback && s.token.size() == 1 && s.token[0] == 'X',
               "streaming fallback is X and flagged");

        DiscreteProgramCodec discrete(tuning);
        WireUnit d = discrete.encode(bogus);
        expect(d.fallback && d.isProgram() && d.program_name == "run_stop_all",
               "discrete fallback is run_stop_all and flagged");
        expect(contains(d.source, "drive_left.stop()") && contains(d.source, "steering.stop()"),
               "stop-all stops drive and steering");
        expect(d.dwell_ms == 0, "stop-all has no dwell");
    }

    // ========================================================================
    // TEST 3: Listener program
    // ========================================================================
    std::cout << "\nTEST 3: Listener program\n";
    {
        StreamingCodec codec(tuning);
        std::string src = codec.listenerProgram();
        expect(contains(src, "usys.stdin.read(1)"), "reads one byte at a time");
        const char tokens_expected[] = {'F', 'T', 'B', 'L', 'R', 'C', 'S', 'X'};
        bool all = true;
        for (char t : tokens_expected) {
            if (!contains(src, std::string("cmd == '") + t + "'")) all = false;
        }
        expect(all, "branch for every token");
        expect(contains(src, "Motor(Port.B)") && contains(src, "Motor(Port.F)") &&
               contains(src, "Motor(Port.D)"), "default ports B/F/D");
        expect(contains(src, "drive_left.run(-800)") && contains(src, "drive_right.run(800)"),
               "forward drives the opposed motors with opposite signs");
        expect(contains(src, "break"), "X ends the loop");

        DiscreteProgramCodec discrete(tuning);
        expect(discrete.listenerProgram().empty(), "discrete mode needs no listener");
    }

    // ========================================================================
    // TEST 4: Discrete programs
    // ========================================================================
    std::cout << "\nTEST 4: Discrete programs\n";
    {
        DriveTuning t;
        t.reverse_speed = 600;
        t.dwell_ms[static_cast<size_t>(DriveCommand::Backward)] = 1500;
        DiscreteProgramCodec codec(t);

        WireUnit back = codec.encode(DriveCommand::Backward);
        expect(back.isProgram() && back.program_name == "run_backward", "Backward -> run_backward");
        expect(back.dwell_ms == 1500, "dwell from tuning");
        expect(contains(back.source, "def run_backward():"), "defines run_backward");
        expect(contains(back.source, "drive_left.run(600)") && contains(back.source, "drive_right.run(-600)"),
               "backward instruction uses reverse speed");
        expect(contains(back.source, "wait(1500)"), "waits the dwell");

        size_t wait_pos = back.source.find("wait(1500)");
        size_t stop_pos = back.source.find("drive_left.stop()");
        expect(wait_pos != std::string::npos && stop_pos != std::string::npos && stop_pos > wait_pos,
               "closing stop after the dwell");
        expect(back.source.size() > 16 &&
               back.source.compare(back.source.size() - 15, 15, "run_backward()\n") == 0,
               "program invokes its function");

        WireUnit left = codec.encode(DriveCommand::TurnLeft);
        expect(left.program_name == "run_left",
               "TurnLeft program name");
        expect(contains(left.source, "run_target(500, -25"), "left steers to -angle");

        WireUnit center = codec.encode(DriveCommand::Center);
        expect(contains(center.source, "run_target(500, 0, wait=True)"), "center waits for target");

        WireUnit shutdown = codec.shutdownUnit();
        expect(shutdown.isProgram() && contains(shutdown.source, "steering.stop()"),
               "shutdown program stops steering too");

        bool every_program_stops = true;
        for (int i = 0; i < DRIVE_COMMAND_COUNT; i++) {
            WireUnit u = codec.encode(static_cast<DriveCommand>(i));
            if (!contains(u.source, "drive_left.stop()\n    drive_right.stop()")) {
                every_program_stops = false;
            }
        }
        expect(every_program_stops, "every program ends with a drive stop");
    }

    // ========================================================================
    // TEST 5: Names and parsing
    // ========================================================================
    std::cout << "\nTEST 5: Names and parsing\n";
    {
        expect(stringToProtocolMode("discrete") == ProtocolMode::DiscreteProgram, "\"discrete\"");
        expect(stringToProtocolMode("STREAMING") == ProtocolMode::Streaming, "\"STREAMING\"");
        expect(stringToProtocolMode("nonsense") == ProtocolMode::Streaming, "unknown -> Streaming");
        ProtocolMode mode = ProtocolMode::DiscreteProgram;
        expect(!parseProtocolMode("nonsense", mode), "parseProtocolMode rejects unknown names");
        expect(parseProtocolMode(protocolModeToString(ProtocolMode::Streaming), mode) &&
               mode == ProtocolMode::Streaming, "streaming name parses back");
        expect(parseProtocolMode(protocolModeToString(ProtocolMode::DiscreteProgram), mode) &&
               mode == ProtocolMode::DiscreteProgram, "discrete name parses back");
        expect(isHubPortName("A") && isHubPortName("F"), "A and F are hub ports");
        expect(!isHubPortName("G") && !isHubPortName("a") && !isHubPortName("AB") && !isHubPortName(""),
               "G, lowercase, two letters and empty are not");
        expect(createCodec(ProtocolMode::DiscreteProgram)->mode() == ProtocolMode::DiscreteProgram,
               "factory builds discrete codec");

        DriveCommand c = DriveCommand::Stop;
        expect(parseDriveCommand("F", c) && c == DriveCommand::Forward, "F parses");
        expect(parseDriveCommand("back", c) && c == DriveCommand::Backward, "back parses");
        expect(parseDriveCommand("Center", c) && c == DriveCommand::Center, "Center parses");
        expect(!parseDriveCommand("jump", c), "jump rejected");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << g_pass << " passed, " << g_fail << " failed\n";
    std::cout << "========================================\n";

    return g_fail == 0 ? 0 : 1;
}
