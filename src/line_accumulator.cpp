// SPDX-License-Identifier: MIT

// src/line_accumulator.cpp
#include "src/line_accumulator.hpp"

namespace jsonl_pipe {

std::vector<LineAccumulator::Record> LineAccumulator::Ingest(std::string_view bytes) {
    std::vector<Record> out;
    Ingest(bytes, [&out](Record record) { out.push_back(std::move(record)); });
    return out;
}

}  // namespace jsonl_pipe
