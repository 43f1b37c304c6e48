#ifndef Common_H
#define Common_H

#include <assert.h>
#include <inttypes.h>
#include <string>
#include <memory>
#include <sstream>
#include <sys/time.h>

#include "Utils.h"
#include "CXException.h"
#include "Array.h"
#include "Window.h"

extern int  optLogLevel;

std::string S (const char* fmt, ...);
std::string formatSize (uint64_t size);

void writeLE (uint64_t num, int bytes, Array<uint8_t> &o);
uint64_t readLE (const uint8_t *in, int bytes);

#endif
