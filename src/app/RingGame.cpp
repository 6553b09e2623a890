// RingGame.cpp

#include "RingGame.h"

#include "src/config/Pins.h"
#include "src/infrastructure/Logger.h"

// Step delay per round, in ms.
static const uint16_t kSpeedsMs[RingGame::kRounds] = {110, 100, 100, 90, 80, 80, 70, 60, 50, 40};

// Running-light color per round: white, then the rainbow from violet to red.
static const CRGB kRoundColors[RingGame::kRounds] = {
  CRGB::White, CRGB::DarkViolet, CRGB::Indigo, CRGB::Blue, CRGB::Cyan,
  CRGB::Green, CRGB::Yellow, CRGB::Orange, CRGB::OrangeRed, CRGB::Red,
};

static const CRGB kMiss = CRGB::Red;
static const CRGB kHit = CRGB::Green;

static constexpr uint8_t kBrightness = 13;  // ~5%
static constexpr uint8_t kIdlePixel = 2;
static constexpr uint32_t kIdleBlinkMs = 100;
static constexpr uint32_t kAfterCatchMs = 500;
static constexpr uint32_t kResultsMs = 3000;
static constexpr uint16_t kHitToneHz = 880;
static constexpr uint16_t kMissToneHz = 220;
static constexpr uint32_t kToneMs = 150;

void RingGame::begin(EventLoop &loop) {
  loop_ = &loop;

  FastLED.addLeds<NEOPIXEL, PIN_NEOPIXEL>(leds_, kPixelCount);
  FastLED.setBrightness(kBrightness);
  fill_solid(leds_, kPixelCount, CRGB::Black);
  FastLED.show();

  randomSeed(analogRead(0));
  reset();

  loop.bind({"BUTTON_A"}, &RingGame::readyThunk, this);
  loop.bind({"BUTTON_B"}, &RingGame::catchThunk, this);
  loop.enableSpeaker(true);
}

void RingGame::start(TimeMs nowMs, void* ctx) {
  stepThunk(nowMs, ctx);
}

void RingGame::reset() {
  ready_ = false;
  round_ = 0;
  pos_ = static_cast<uint8_t>(random(0, kPixelCount));
  for (uint8_t i = 0; i < kRounds; ++i) results_[i] = 0;
}

void RingGame::render() {
  fill_solid(leds_, kPixelCount, CRGB::Black);
  leds_[pos_] = kRoundColors[round_];
  FastLED.show();
}

void RingGame::step(TimeMs nowMs) {
  if (!ready_) {
    // Blink one pixel until button A arms the game.
    fill_solid(leds_, kPixelCount, CRGB::Black);
    leds_[kIdlePixel] = ((nowMs / 1000) % 2 == 0) ? CRGB::White : CRGB::Black;
    FastLED.show();
    mainId_ = loop_->after(kIdleBlinkMs, &RingGame::stepThunk, this, mainId_);
    return;
  }

  if (round_ >= kRounds) {
    finishId_ = loop_->after(0, &RingGame::finishThunk, this, finishId_);
    return;
  }

  mainId_ = loop_->after(kSpeedsMs[round_], &RingGame::stepThunk, this, mainId_);
  pos_ = (pos_ + 1) % kPixelCount;
  render();
}

void RingGame::finish() {
  fill_solid(leds_, kPixelCount, CRGB::Black);
  uint8_t score = 0;
  for (uint8_t i = 0; i < kRounds; ++i) {
    if (results_[i]) {
      leds_[i] = kHit;
      score++;
    }
  }
  FastLED.show();
  Logger::info("Ring: game over, %u/%u caught", (unsigned)score, (unsigned)kRounds);

  reset();
  mainId_ = loop_->after(kResultsMs, &RingGame::stepThunk, this, mainId_);
}

Propagation RingGame::onReady() {
  if (!ready_) Logger::info("Ring: new game");
  ready_ = true;
  return Propagation::Consumed;
}

Propagation RingGame::onCatch() {
  if (!ready_ || round_ >= kRounds) return Propagation::Consumed;

  const bool good = pos_ == kTargetPixel;
  fill_solid(leds_, kPixelCount, good ? kHit : kMiss);
  leds_[pos_] = good ? kMiss : kHit;
  FastLED.show();
  loop_->playSound(good ? kHitToneHz : kMissToneHz, kToneMs);

  results_[round_] = good ? 1 : 0;
  round_++;
  pos_ = static_cast<uint8_t>(random(0, kPixelCount));

  // Replaces the pending step so the result stays visible for a moment.
  mainId_ = loop_->after(kAfterCatchMs, &RingGame::stepThunk, this, mainId_);
  return Propagation::Consumed;
}

void RingGame::stepThunk(TimeMs nowMs, void* ctx) {
  static_cast<RingGame*>(ctx)->step(nowMs);
}

void RingGame::finishThunk(TimeMs, void* ctx) {
  static_cast<RingGame*>(ctx)->finish();
}

Propagation RingGame::readyThunk(TimeMs, void* ctx) {
  return static_cast<RingGame*>(ctx)->onReady();
}

Propagation RingGame::catchThunk(TimeMs, void* ctx) {
  return static_cast<RingGame*>(ctx)->onCatch();
}
