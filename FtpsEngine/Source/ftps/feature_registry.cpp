// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "feature_registry.h"

using namespace fse;
using namespace ftps;


const char* ftps::getCommandToken(FtpCommand cmd)
{
    switch (cmd)
    {
        //*INDENT-OFF*
        case FtpCommand::auth: return "AUTH";
        case FtpCommand::clnt: return "CLNT";
        case FtpCommand::eprt: return "EPRT";
        case FtpCommand::epsv: return "EPSV";
        case FtpCommand::host: return "HOST";
        case FtpCommand::lang: return "LANG";
        case FtpCommand::mdtm: return "MDTM";
        case FtpCommand::mfmt: return "MFMT";
        case FtpCommand::mlst: return "MLST";
        case FtpCommand::mode: return "MODE";
        case FtpCommand::pbsz: return "PBSZ";
        case FtpCommand::prot: return "PROT";
        case FtpCommand::rest: return "REST";
        case FtpCommand::size: return "SIZE";
        case FtpCommand::tvfs: return "TVFS";
        case FtpCommand::utf8: return "UTF8";
        //*INDENT-ON*
    }
    assert(false);
    return "";
}


FeatureMap ftps::parseFeatReply(const FtpReply& reply)
{
    /*  FEAT command: https://tools.ietf.org/html/rfc2389#page-4
            211-Extensions supported:
             MDTM
             MLST type*;size*;modify*;
             AUTH TLS
            211 END                                 */
    FeatureMap output;

    if (reply.code != 211 || reply.lines.size() < 2) //"211 No features" and friends
        return output;

    std::for_each(reply.lines.begin() + 1, reply.lines.end() - 1, [&](std::string line)
    {
        //suppport ProFTPD with "MultilineRFC2228 = on" https://freefilesync.org/forum/viewtopic.php?t=7243
        if (startsWith(line, "211-"))
            line = ' ' + afterFirst(line, '-', IfNotFoundReturn::none);

        //"each line [...] MUST begin with a single space": be lenient anyway
        const std::string_view feat = trimCpy(std::string_view(line));
        if (feat.empty())
            return;

        const std::string token = getUpperCase(beforeFirst(feat, ' ', IfNotFoundReturn::all));
        const std::string_view value = trimCpy(afterFirst(feat, ' ', IfNotFoundReturn::none));

        std::vector<std::string>& values = output[token];
        if (!value.empty())
            values.emplace_back(value);
    });

    //support non-compliant servers: https://freefilesync.org/forum/viewtopic.php?t=7355#p24694
    if (!output.contains("UTF8"))
        if (auto it = output.find("UTF-8"); it != output.end())
            output["UTF8"] = it->second;

    return output;
}


const FeatureMap& FeatureRegistry::getFeatures() //throw ConnectionError, ProtocolError
{
    if (!features_)
    {
        const FtpReply reply = control_.executeCommand("FEAT"); //throw ConnectionError, ProtocolError

        FeatResult result;
        //negative reply: server does not support/allow FEAT => no features
        if (classifyReply(reply.code) == ReplyClass::positiveCompletion)
        {
            result.supported = true;
            result.features = parseFeatReply(reply);
        }
        else
            control_.getLog().logInfo("FEAT not supported: " + formatFtpStatus(reply.code));

        features_ = std::move(result);
    }
    return features_->features;
}


bool FeatureRegistry::hasFeature(const std::string& token) //throw ConnectionError, ProtocolError
{
    const FeatureMap& features = getFeatures(); //throw ConnectionError, ProtocolError
    return features.find(token) != features.end();
}


bool FeatureRegistry::hasFeature(const std::string& token, const std::string& value) //throw ConnectionError, ProtocolError
{
    const std::vector<std::string>& values = getFeatureValues(token); //throw ConnectionError, ProtocolError
    return std::any_of(values.begin(), values.end(), [&](const std::string& v) { return equalAsciiNoCase(v, value); });
}


const std::vector<std::string>& FeatureRegistry::getFeatureValues(const std::string& token) //throw ConnectionError, ProtocolError
{
    static const std::vector<std::string> noValues;

    const FeatureMap& features = getFeatures(); //throw ConnectionError, ProtocolError
    auto it = features.find(token);
    return it != features.end() ? it->second : noValues;
}


std::optional<std::string> FeatureRegistry::getFeatureValue(const std::string& token) //throw ConnectionError, ProtocolError
{
    const std::vector<std::string>& values = getFeatureValues(token); //throw ConnectionError, ProtocolError
    if (values.empty())
        return std::nullopt;
    return values.front();
}


bool FeatureRegistry::hasFeatures() //throw ConnectionError, ProtocolError
{
    getFeatures(); //throw ConnectionError, ProtocolError
    return features_->supported;
}
