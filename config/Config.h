#pragma once

#include "config/ConfigReader.h"
#include <string>
#include <vector>
namespace config
{

inline std::vector<std::string> defaultIceServers()
{
    return {"stun:stun.l.google.com:19302", "stun:stun1.l.google.com:19302"};
}

class Config : public ConfigReader
{
public:
    CFG_PROP(bool, logStdOut, true);
    CFG_PROP(std::string, logLevel, "INFO");
    CFG_PROP(std::string, logFile, "");

    CFG_GROUP()
    // STUN urls handed to the transport. TURN is never negotiated.
    CFG_PROP(std::vector<std::string>, iceServers, defaultIceServers());
    CFG_PROP(uint32_t, maxCandidates, 4);
    CFG_PROP(uint32_t, timeout, 30000); // ms, from payload shown until data channel open
    CFG_PROP(uint32_t, gatherTimeout, 10000); // ms
    CFG_PROP(std::string, channelLabel, "qwbp");
    CFG_GROUP_END(pairing);
};

} // namespace config
