#include <algorithm>
#include <string>
#include <array>
#include <vector>
#include <cmath>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <stdexcept>

#include <MiniFB.h>

#include "chip8.h"
#include "machine.h"
#include "interpreter.h"
#include "scheduler.h"

constexpr const char *WindowTitle = "fish n chips";
constexpr int PixelScale = 20;

typedef std::array<uint8_t, 3> vec3ub;

constexpr vec3ub BackgroundColor = {74, 74, 74};
constexpr vec3ub PixelColor = {255, 205, 230};     // without gradient coloring
constexpr float GradientSaturation = 0.2f;
constexpr float GradientValue = 1.0f;

vec3ub rgbFromHSV(uint32_t hue, float saturation, float value)
{
    float c = value * saturation;
    float x = c * (1.0f - std::fabs(std::fmod(hue / 60.0f, 2.0f) - 1.0f));
    float m = value - c;
    float r, g, b;
    switch((hue % 360) / 60) {
        case 0: r = c; g = x; b = 0; break;
        case 1: r = x; g = c; b = 0; break;
        case 2: r = 0; g = c; b = x; break;
        case 3: r = 0; g = x; b = c; break;
        case 4: r = x; g = 0; b = c; break;
        default: r = c; g = 0; b = x; break;
    }
    return { (uint8_t)((r + m) * 255), (uint8_t)((g + m) * 255), (uint8_t)((b + m) * 255) };
}

struct Interface
{
    Keypad& keypad;
    bool gradientColoring;
    uint32_t hue = 0;
    bool closed = false;
    bool frameChanged = true;
    bool soundOn = false;
    bool succeeded = false;

    std::array<std::array<uint8_t, DisplayWidth>, DisplayHeight> frame;

    mfb_window *window;
    int windowWidth = DisplayWidth * PixelScale;
    int windowHeight = DisplayHeight * PixelScale;
    std::vector<uint32_t> windowBuffer;

    Interface(const std::string& name, Keypad& keypad, bool gradientColoring, uint32_t frameRate) :
        keypad(keypad),
        gradientColoring(gradientColoring)
    {
        for(auto& rowOfPixels : frame) {
            rowOfPixels.fill(0);
        }
        window = mfb_open_ex(name.c_str(), windowWidth, windowHeight, WF_RESIZABLE);
        if (window) {
            windowBuffer.resize(windowWidth * windowHeight);
            mfb_set_user_data(window, (void *) this);
            mfb_set_resize_callback(window, resizecb);
            mfb_set_keyboard_callback(window, keyboardcb);
            mfb_set_target_fps(frameRate);
            succeeded = true;
        }
    }

    // Frame-ready signal from the scheduler.  Only the latest frame is kept;
    // frames signaled during a catch-up burst are pushed to the window once.
    void present(const Display& display)
    {
        if(gradientColoring) {
            hue = (hue + 1) % 360;
            frameChanged = true;
        }
        if(display.changed) {
            frame = display.pixels;
            frameChanged = true;
        }
    }

    void startSound(float frequency)
    {
        if(!soundOn) {
            printf("\abeep %.1f Hz\n", frequency);
            fflush(stdout);
            soundOn = true;
        }
    }

    void stopSound()
    {
        soundOn = false;
    }

    bool redraw()
    {
        vec3ub on = gradientColoring ? rgbFromHSV(hue, GradientSaturation, GradientValue) : PixelColor;
        uint32_t onColor = MFB_RGB(on[0], on[1], on[2]);
        uint32_t offColor = MFB_RGB(BackgroundColor[0], BackgroundColor[1], BackgroundColor[2]);
        for(int row = 0; row < windowHeight; row++) {
            int displayY = row * DisplayHeight / windowHeight;
            for(int col = 0; col < windowWidth; col++) {
                int displayX = col * DisplayWidth / windowWidth;
                windowBuffer[col + row * windowWidth] = frame.at(displayY).at(displayX) ? onColor : offColor;
            }
        }
        int status = mfb_update_ex(window, windowBuffer.data(), windowWidth, windowHeight);
        closed = closed || (status < 0);
        return status >= 0;
    }

    void resize(int width, int height)
    {
        windowWidth = std::max(width, 1);
        windowHeight = std::max(height, 1);
        windowBuffer.resize(windowWidth * windowHeight);
        frameChanged = true;
    }

    static void resizecb(mfb_window *window, int width, int height)
    {
        Interface *ifc = static_cast<Interface *>(mfb_get_user_data(window));
        ifc->resize(width, height);
        mfb_set_viewport(window, 0, 0, width, height);
    }

    // Key layout is the 4x4 block under 1234:
    //     1 2 3 C      1 2 3 4
    //     4 5 6 D  <-  A Z E R
    //     7 8 9 E      Q S D F
    //     A 0 B F      W X C V
    void keyboard(mfb_key key, mfb_key_mod mod, bool isPressed)
    {
        switch(key) {
            case KB_KEY_ESCAPE:
                if(isPressed) {
                    mfb_close(window);
                    closed = true;
                }
                break;
            case KB_KEY_1: keypad.setPressed(0x1, isPressed); break;
            case KB_KEY_2: keypad.setPressed(0x2, isPressed); break;
            case KB_KEY_3: keypad.setPressed(0x3, isPressed); break;
            case KB_KEY_4: keypad.setPressed(0xC, isPressed); break;
            case KB_KEY_A: keypad.setPressed(0x4, isPressed); break;
            case KB_KEY_Z: keypad.setPressed(0x5, isPressed); break;
            case KB_KEY_E: keypad.setPressed(0x6, isPressed); break;
            case KB_KEY_R: keypad.setPressed(0xD, isPressed); break;
            case KB_KEY_Q: keypad.setPressed(0x7, isPressed); break;
            case KB_KEY_S: keypad.setPressed(0x8, isPressed); break;
            case KB_KEY_D: keypad.setPressed(0x9, isPressed); break;
            case KB_KEY_F: keypad.setPressed(0xE, isPressed); break;
            case KB_KEY_W: keypad.setPressed(0xA, isPressed); break;
            case KB_KEY_X: keypad.setPressed(0x0, isPressed); break;
            case KB_KEY_C: keypad.setPressed(0xB, isPressed); break;
            case KB_KEY_V: keypad.setPressed(0xF, isPressed); break;
            default: /* pass */ break;
        }
        if(debug & DEBUG_KEYS) {
            printf("host key %d %s\n", (int)key, isPressed ? "down" : "up");
        }
    }

    static void keyboardcb(mfb_window *window, mfb_key key, mfb_key_mod mod, bool isPressed)
    {
        Interface *ifc = static_cast<Interface *>(mfb_get_user_data(window));
        ifc->keyboard(key, mod, isPressed);
    }

    bool iterate()
    {
        bool success = true;
        if(frameChanged) {
            success = redraw();
            frameChanged = false;
        } else {
            success = (mfb_update_events(window) >= 0);
        }
        if(success && !closed) {
            mfb_wait_sync(window);
        }
        return success && !closed;
    }
};

std::vector<uint8_t> readProgramFile(const std::string& path)
{
    FILE *fp = fopen(path.c_str(), "rb");
    if(!fp) {
        throw std::runtime_error("couldn't open " + path);
    }
    std::vector<uint8_t> image;
    uint8_t buffer[512];
    size_t got;
    while((got = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
        image.insert(image.end(), buffer, buffer + got);
    }
    bool failed = ferror(fp) != 0;
    fclose(fp);
    if(failed) {
        throw std::runtime_error("couldn't read " + path);
    }
    return image;
}

void usage(const char *name)
{
    fprintf(stderr, "usage: %s [options] ROM\n", name);
    fprintf(stderr, "options:\n");
    fprintf(stderr, "\t-c, --clock-rate N      - execute N instructions per second (default 1000)\n");
    fprintf(stderr, "\t-f, --framerate N       - present N frames per second (default 60)\n");
    fprintf(stderr, "\t-v, --frequency F       - beep at F Hz (default 553.0)\n");
    fprintf(stderr, "\t-g, --gradient-colors   - cycle the pixel color every frame\n");
    fprintf(stderr, "\t--debug name            - enable trace output, one of\n");
    fprintf(stderr, "\t                          \"state\", \"asm\", \"draw\", \"keys\", \"timing\"\n");
}

bool isOption(const char *arg, const char *shortName, const char *longName)
{
    return (strcmp(arg, shortName) == 0) || (strcmp(arg, longName) == 0);
}

uint32_t parseRateOption(const char *option, const char *value, const char *progname)
{
    uint32_t rate;
    if(!parsePositiveInteger(value, rate)) {
        fprintf(stderr, "%s must be a positive integer, got \"%s\".\n", option, value);
        usage(progname);
        exit(EXIT_FAILURE);
    }
    return rate;
}

int main(int argc, char **argv)
{
    const char *progname = argv[0];
    argc -= 1;
    argv += 1;

    Config config;

    while((argc > 0) && (argv[0][0] == '-')) {
        if(isOption(argv[0], "-c", "--clock-rate")) {
            if(argc < 2) {
                fprintf(stderr, "%s option requires a rate.\n", argv[0]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            config.instructionRateHz = parseRateOption(argv[0], argv[1], progname);
            argv += 2;
            argc -= 2;
        } else if(isOption(argv[0], "-f", "--framerate")) {
            if(argc < 2) {
                fprintf(stderr, "%s option requires a rate.\n", argv[0]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            config.frameRateHz = parseRateOption(argv[0], argv[1], progname);
            argv += 2;
            argc -= 2;
        } else if(isOption(argv[0], "-v", "--frequency")) {
            if(argc < 2) {
                fprintf(stderr, "%s option requires a frequency.\n", argv[0]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            char *end;
            float frequency = strtof(argv[1], &end);
            if((*end != '\0') || !(frequency > 0.0f)) {
                fprintf(stderr, "Frequency must be a positive number, got \"%s\".\n", argv[1]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            config.beepFrequencyHz = frequency;
            argv += 2;
            argc -= 2;
        } else if(isOption(argv[0], "-g", "--gradient-colors")) {
            config.gradientColoring = true;
            argv += 1;
            argc -= 1;
        } else if(strcmp(argv[0], "--debug") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--debug option requires a debug flag to enable.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            std::string debugKeyword = argv[1];
            if(keywordsToDebugFlags.count(debugKeyword) == 0) {
                fprintf(stderr, "unknown debug flag \"%s\".\n", argv[1]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            debug |= keywordsToDebugFlags.at(debugKeyword);
            fprintf(stderr, "debug value now 0x%02X\n", debug);
            argv += 2;
            argc -= 2;
        } else if(
            (strcmp(argv[0], "-help") == 0) ||
            (strcmp(argv[0], "-h") == 0) ||
            (strcmp(argv[0], "-?") == 0))
        {
            usage(progname);
            exit(EXIT_SUCCESS);
        } else {
            fprintf(stderr, "unknown parameter \"%s\"\n", argv[0]);
            usage(progname);
            exit(EXIT_FAILURE);
        }
    }

    if(argc < 1) {
        usage(progname);
        exit(EXIT_FAILURE);
    }

    std::string romFile = argv[0];

    Machine machine;

    std::vector<uint8_t> image;
    try {
        image = readProgramFile(romFile);
    } catch(const std::runtime_error& e) {
        fprintf(stderr, "Cannot load ROM file %s: %s\n", romFile.c_str(), e.what());
        exit(EXIT_FAILURE);
    }
    if(!machine.memory.loadProgram(image)) {
        Fault fault;
        fault.kind = PROGRAM_TOO_LARGE;
        fault.pc = ProgramLoadAddress;
        fprintf(stderr, "Cannot load ROM file %s: %s\n", romFile.c_str(), describeFault(fault).c_str());
        exit(EXIT_FAILURE);
    }

    Interface interface(WindowTitle, machine.keypad, config.gradientColoring, config.frameRateHz);
    if(!interface.succeeded) {
        fprintf(stderr, "opening the user interface failed.\n");
        exit(EXIT_FAILURE);
    }

    Interpreter interpreter;

    try {
        Scheduler<Interface> scheduler(machine, interpreter, interface, config);

        std::chrono::time_point<std::chrono::steady_clock> start = std::chrono::steady_clock::now();

        bool done = false;
        while(!done) {
            auto now = std::chrono::steady_clock::now();
            clk_t elapsed = std::chrono::duration_cast<std::chrono::microseconds>(now - start).count();
            if(scheduler.updatePastClock(elapsed) == Scheduler<Interface>::HALTED) {
                fprintf(stderr, "halted: %s\n", describeFault(scheduler.fault).c_str());
                exit(EXIT_FAILURE);
            }
            done = !interface.iterate();
        }
    } catch(const std::runtime_error& e) {
        fprintf(stderr, "Cannot run ROM file %s: %s\n", romFile.c_str(), e.what());
        exit(EXIT_FAILURE);
    }

    return EXIT_SUCCESS;
}
