#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct AudioBlob {
    std::vector<uint8_t> bytes;
    std::string          mime_type;

    bool empty() const { return bytes.empty(); }
};

/* The capture stream is a live container (WebM from the encoder): its
 * chunks concatenated in delivery order form the whole recording. */
AudioBlob assemble_blob(const std::vector<std::vector<uint8_t>>& chunks,
                        const std::string& mime_type);
