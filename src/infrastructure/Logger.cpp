// Logger.cpp

#include "Logger.h"

#include <stdio.h>

#include "src/config/BuildConfig.h"

LogLevel Logger::currentLevel_ = static_cast<LogLevel>(BUILD_LOG_LEVEL);
Logger::Sink Logger::sink_ = &Logger::writeStdout;
void* Logger::sinkCtx_ = nullptr;

void Logger::setSink(Sink sink, void* ctx) {
  sink_ = sink ? sink : &Logger::writeStdout;
  sinkCtx_ = sink ? ctx : nullptr;
}

void Logger::printFormatted(const char* level, const char* fmt, va_list args) {
  char buffer[256];
  int n = snprintf(buffer, sizeof(buffer), "[%s] ", level);
  if (n < 0) return;
  vsnprintf(buffer + n, sizeof(buffer) - n, fmt, args);
  sink_(buffer, sinkCtx_);
}

void Logger::writeStdout(const char* line, void*) {
  fputs(line, stdout);
  fputc('\n', stdout);
}
