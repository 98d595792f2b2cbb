// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FEATURE_REGISTRY_H_2291837465019283741
#define FEATURE_REGISTRY_H_2291837465019283741

#include <map>
#include "control_channel.h"


namespace ftps
{
//symbolic names for FEAT tokens (RFC 2389, RFC 3659, RFC 4217)
enum class FtpCommand
{
    auth,
    clnt,
    eprt,
    epsv,
    host,
    lang,
    mdtm,
    mfmt,
    mlst,
    mode,
    pbsz,
    prot,
    rest,
    size,
    tvfs,
    utf8,
};
const char* getCommandToken(FtpCommand cmd); //"MDTM"


//upper-cased token => advertised parameters, e.g. "AUTH" => {"TLS"}, "MLST" => {"type*;size*;modify*;"}
using FeatureMap = std::map<std::string, std::vector<std::string>, fse::LessAsciiNoCase>;

FeatureMap parseFeatReply(const FtpReply& reply);


class FeatureRegistry
{
public:
    explicit FeatureRegistry(ControlChannel& control) : control_(control) {}

    //first call sends FEAT; result is cached for the life time of the control connection
    bool hasFeature(const std::string& token); //throw ConnectionError, ProtocolError
    bool hasFeature(FtpCommand cmd) { return hasFeature(getCommandToken(cmd)); } //
    bool hasFeature(const std::string& token, const std::string& value); //

    const std::vector<std::string>& getFeatureValues(const std::string& token); //throw ConnectionError, ProtocolError; empty if not advertised
    std::optional<std::string> getFeatureValue(const std::string& token); //throw ConnectionError, ProtocolError; first value

    bool hasFeatures(); //throw ConnectionError, ProtocolError; FEAT was answered positively

    const FeatureMap& getFeatures(); //throw ConnectionError, ProtocolError

    void reset() { features_.reset(); } //new control connection

private:
    FeatureRegistry           (const FeatureRegistry&) = delete;
    FeatureRegistry& operator=(const FeatureRegistry&) = delete;

    ControlChannel& control_;

    struct FeatResult
    {
        bool supported = false;
        FeatureMap features;
    };
    std::optional<FeatResult> features_;
};
}

#endif //FEATURE_REGISTRY_H_2291837465019283741
