#include "audio_blob.h"

AudioBlob assemble_blob(const std::vector<std::vector<uint8_t>>& chunks,
                        const std::string& mime_type)
{
    AudioBlob blob;
    blob.mime_type = mime_type;

    size_t total = 0;
    for (const auto& c : chunks) total += c.size();
    blob.bytes.reserve(total);
    for (const auto& c : chunks)
        blob.bytes.insert(blob.bytes.end(), c.begin(), c.end());
    return blob;
}
