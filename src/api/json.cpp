#include <allium/onion/api/json.hpp>

#include <sstream>
#include <stdexcept>

namespace allium { namespace onion { namespace api {

    std::string as_json(const google::protobuf::Message& msg,
                        google::protobuf::util::JsonPrintOptions opts)
    {
        std::string result;
        auto status = google::protobuf::util::MessageToJsonString(msg,
                                                                  std::addressof(result),
                                                                  opts);
        if (!status.ok())
        {
            std::ostringstream ss;
            ss << status;
            throw std::runtime_error(ss.str());
        }
        return result;
    }

    void from_json(google::protobuf::Message& msg, const std::string& text)
    {
        google::protobuf::util::JsonParseOptions opts;
        opts.ignore_unknown_fields = false;
        msg.Clear();
        auto status = google::protobuf::util::JsonStringToMessage(text,
                                                                  std::addressof(msg),
                                                                  opts);
        if (!status.ok())
        {
            std::ostringstream ss;
            ss << msg.GetDescriptor()->full_name() << ": " << status;
            throw std::runtime_error(ss.str());
        }
    }
    
}}}
