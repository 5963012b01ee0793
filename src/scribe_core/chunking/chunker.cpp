#include "scribe_core/chunking/chunker.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace scribe_core {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_terminator(char c) {
  return c == '.' || c == '!' || c == '?';
}

// UTF-8 continuation bytes look like 10xxxxxx.
bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

Chunker::Chunker(ChunkerConfig config) : config_(config) {
  if (config_.max_chars == 0) {
    throw std::invalid_argument("Chunker max_chars must be greater than 0");
  }
  if (config_.overlap_chars >= config_.max_chars) {
    throw std::invalid_argument("Chunker overlap_chars must be smaller than max_chars");
  }
}

std::vector<Chunker::Span> Chunker::split_sentences(const std::string& text) const {
  std::vector<Span> sentences;
  const size_t n = text.size();
  size_t start = 0;
  size_t i = 0;

  while (i < n) {
    const char c = text[i];
    size_t boundary = 0;

    if (is_terminator(c) && (i + 1 == n || is_space(text[i + 1]))) {
      size_t j = i + 1;
      while (j < n && is_space(text[j])) {
        ++j;
      }
      boundary = j;
    } else if (c == '\n') {
      // A blank line (two newlines separated only by whitespace) ends a paragraph
      size_t j = i;
      int newlines = 0;
      while (j < n && is_space(text[j])) {
        if (text[j] == '\n')
          ++newlines;
        ++j;
      }
      if (newlines >= 2) {
        boundary = j;
      }
    }

    if (boundary > 0) {
      sentences.push_back({start, boundary});
      start = boundary;
      i = boundary;
    } else {
      ++i;
    }
  }

  if (start < n) {
    sentences.push_back({start, n});
  }
  return sentences;
}

size_t Chunker::overlap_start(const std::string& text,
                              const std::vector<Span>& sentences,
                              size_t first_sentence,
                              size_t last_sentence,
                              size_t chunk_start) const {
  const size_t chunk_end = sentences[last_sentence].end;
  const size_t window_start =
      chunk_end > config_.overlap_chars ? chunk_end - config_.overlap_chars : 0;
  const size_t floor = std::max(chunk_start, window_start);

  // Prefer whole trailing sentences that fit in the overlap window
  for (size_t s = first_sentence; s <= last_sentence; ++s) {
    if (sentences[s].start >= floor) {
      return sentences[s].start;
    }
  }

  if (config_.overlap_chars == 0) {
    return chunk_end;
  }

  size_t start = floor;
  while (start < chunk_end && is_continuation_byte(text[start])) {
    ++start;
  }
  return start;
}

std::vector<Chunk> Chunker::chunk(const std::string& document_ref,
                                  const std::string& text,
                                  ChunkId first_id) const {
  std::vector<Chunk> chunks;
  if (std::all_of(text.begin(), text.end(), is_space)) {
    return chunks;
  }

  const std::vector<Span> sentences = split_sentences(text);
  ChunkId next_id = first_id;
  size_t next = 0;
  size_t chunk_start = 0;
  size_t first_in_chunk = 0;

  while (next < sentences.size()) {
    // Drop the overlap if it would push a normal-sized sentence over the limit
    if (sentences[next].end - chunk_start > config_.max_chars) {
      chunk_start = sentences[next].start;
    }

    size_t last = next;
    ++next;
    while (next < sentences.size() && sentences[next].end - chunk_start <= config_.max_chars) {
      last = next;
      ++next;
    }

    const size_t chunk_end = sentences[last].end;
    Chunk chunk;
    chunk.id = next_id++;
    chunk.document_ref = document_ref;
    chunk.start_offset = chunk_start;
    chunk.end_offset = chunk_end;
    chunk.text = text.substr(chunk_start, chunk_end - chunk_start);
    chunks.push_back(std::move(chunk));

    if (next < sentences.size()) {
      const size_t new_start = overlap_start(text, sentences, first_in_chunk, last, chunk_start);
      first_in_chunk = next;
      // Remember which consumed sentences the overlap re-includes
      while (first_in_chunk > 0 && sentences[first_in_chunk - 1].start >= new_start) {
        --first_in_chunk;
      }
      chunk_start = new_start;
    }
  }

  std::cout << "[Chunker] " << document_ref << ": " << text.size() << " bytes -> "
            << chunks.size() << " chunks" << std::endl;
  return chunks;
}

}  // namespace scribe_core
