#pragma once

#include <httplib.h>

namespace scripthub {
    class SystemHandler {
    public:
        static void setup_routes(httplib::Server& server);
        static void health(const httplib::Request& req, httplib::Response& res);
    };
}
