#include "bin_router/point_source.hpp"

#include <curl/curl.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bin_router
{
    namespace
    {
        size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp)
        {
            ((std::string *)userp)->append((char *)contents, size * nmemb);
            return size * nmemb;
        }
    }

    std::string fetch_points_payload(const std::vector<std::string> &urls, long timeout_seconds)
    {
        if (urls.empty())
        {
            return "";
        }

        CURL *curl = curl_easy_init();
        if (!curl)
        {
            std::cerr << "Failed to initialize CURL" << std::endl;
            return "";
        }

        std::string response_data;
        bool success = false;

        for (const auto &url : urls)
        {
            std::cout << "Fetching bins from " << url << "..." << std::endl;
            response_data.clear();

            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
            curl_easy_setopt(curl, CURLOPT_USERAGENT, "BinRouter/1.0");
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

            CURLcode res = curl_easy_perform(curl);

            if (res == CURLE_OK)
            {
                long http_code = 0;
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

                if (http_code == 200)
                {
                    success = true;
                    std::cout << "Fetched " << response_data.size() << " bytes from " << url << std::endl;
                    break;
                }
                else
                {
                    std::cout << "HTTP " << http_code << ", trying next store..." << std::endl;
                }
            }
            else
            {
                std::cout << "Connection failed: " << curl_easy_strerror(res) << ", trying next store..." << std::endl;
            }
        }

        curl_easy_cleanup(curl);

        if (!success)
        {
            std::cerr << "All point stores failed" << std::endl;
            return "";
        }

        return response_data;
    }

    std::string read_points_file(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Unable to open " + path);
        }

        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }

}
