#ifndef MANDRILL_CPP_CURL_GLOBAL_HPP
#define MANDRILL_CPP_CURL_GLOBAL_HPP

namespace http::client {

    // Owns libcurl's process-wide state. Construct once in main(), before any CurlEasy
    // and before spawning threads.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace http::client

#endif
