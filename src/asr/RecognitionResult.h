#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct WordInfo {
  std::string word;
  double startS = 0.0; // offset from segment start
  double endS = 0.0;
  double confidence = 0.0;
};

struct RecognitionResult {
  uint64_t sequence = 0;
  std::string text;
  std::vector<WordInfo> words;
  double confidence = 0.0;
  bool isFinal = false;
  std::chrono::milliseconds latency{0}; // seal to final, finals only
};
