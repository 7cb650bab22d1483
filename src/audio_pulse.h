#pragma once

#include <cstdint>

/* true once `buffered_usec` of queued capture covers one read of
 * `block_frames`, i.e. pa_simple_read will not wait on the device */
bool pulse_block_ready(uint64_t buffered_usec, int block_frames, int sample_rate);
