// FakeDevices.h
// Host-side stand-ins for the clock and input/audio drivers, driven by tests.

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "src/domain/AudioOutput.h"
#include "src/domain/Clock.h"
#include "src/domain/InputDevices.h"
#include "src/infrastructure/Logger.h"

// Simulated time: sleeping advances the clock. undershootMs makes every sleep
// wake early by that much, to exercise the loop's residual re-check.
class FakeClock : public Clock {
 public:
  TimeMs now = 0;
  TimeMs undershootMs = 0;
  std::vector<TimeMs> sleeps;

  TimeMs nowMs() override { return now; }

  void sleepMs(TimeMs durationMs) override {
    sleeps.push_back(durationMs);
    now += durationMs > undershootMs ? durationMs - undershootMs : 1;
  }
};

// Shared state the fake drivers read from. Tests flip levels between polls.
class FakeInputFactory : public InputDeviceFactory {
 public:
  std::map<std::string, bool> levels;
  std::map<std::string, uint16_t> analog;
  uint8_t gamepadBits = 0;
  bool hasGamepad = true;

  int digitalCreated = 0;
  int touchCreated = 0;
  int analogCreated = 0;
  int gamepadCreated = 0;

  // Names the "board" has no pin for.
  std::vector<std::string> missing;

  void press(const std::string &name) { levels[name] = true; }
  void release(const std::string &name) { levels[name] = false; }

  std::unique_ptr<DigitalInput> createDigital(const std::string &name) override {
    if (isMissing(name)) return std::unique_ptr<DigitalInput>();
    digitalCreated++;
    return std::unique_ptr<DigitalInput>(new Pin(*this, name));
  }

  std::unique_ptr<DigitalInput> createTouch(const std::string &name) override {
    if (isMissing(name)) return std::unique_ptr<DigitalInput>();
    touchCreated++;
    return std::unique_ptr<DigitalInput>(new Pin(*this, name));
  }

  std::unique_ptr<AnalogInput> createAnalog(const std::string &name) override {
    if (isMissing(name)) return std::unique_ptr<AnalogInput>();
    analogCreated++;
    return std::unique_ptr<AnalogInput>(new Axis(*this, name));
  }

  std::unique_ptr<ShiftRegisterInput> createGamepad() override {
    if (!hasGamepad) return std::unique_ptr<ShiftRegisterInput>();
    gamepadCreated++;
    return std::unique_ptr<ShiftRegisterInput>(new Gamepad(*this));
  }

 private:
  class Pin : public DigitalInput {
   public:
    Pin(FakeInputFactory &owner, const std::string &name) : owner_(owner), name_(name) {}
    bool read() override { return owner_.levels[name_]; }

   private:
    FakeInputFactory &owner_;
    std::string name_;
  };

  class Axis : public AnalogInput {
   public:
    Axis(FakeInputFactory &owner, const std::string &name) : owner_(owner), name_(name) {}
    uint16_t read() override { return owner_.analog[name_]; }

   private:
    FakeInputFactory &owner_;
    std::string name_;
  };

  class Gamepad : public ShiftRegisterInput {
   public:
    explicit Gamepad(FakeInputFactory &owner) : owner_(owner) {}
    uint8_t readBits() override { return owner_.gamepadBits; }

   private:
    FakeInputFactory &owner_;
  };

  bool isMissing(const std::string &name) const {
    for (const std::string &m : missing) {
      if (m == name) return true;
    }
    return false;
  }
};

class FakeSpeaker : public AudioOutput {
 public:
  bool enabled = false;
  uint16_t playing = 0;  // 0 when silent
  std::vector<uint16_t> played;

  void setEnabled(bool on) override { enabled = on; }
  void play(uint16_t frequencyHz) override {
    playing = frequencyHz;
    played.push_back(frequencyHz);
  }
  void stop() override { playing = 0; }
};

// Captures log lines for the lifetime of the object.
class LogCapture {
 public:
  std::vector<std::string> lines;

  LogCapture() { Logger::setSink(&LogCapture::write, this); }
  ~LogCapture() { Logger::setSink(nullptr); }

  bool contains(const std::string &text) const {
    for (const std::string &l : lines) {
      if (l.find(text) != std::string::npos) return true;
    }
    return false;
  }

 private:
  static void write(const char* line, void* ctx) {
    static_cast<LogCapture*>(ctx)->lines.push_back(line);
  }
};
