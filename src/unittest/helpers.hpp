#pragma once

#include "logging.hpp"
#include "resolver.hpp"

#include <arpa/nameser.h>
#include <stdlib.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/* Resolver answering from tables, remembering every query */
class FakeResolver : public Resolver {
    public:
        struct Call {
            std::string question;
            uint16_t qtype;
            uint16_t qclass;
            unsigned lifetime;
            std::vector<std::string> nameservers;
        };

        typedef std::pair<std::string, uint16_t> Key;

        std::map<Key, DnsReply> replies;       ///< Used for queries to the default nameservers.
        std::map<Key, DnsReply> directReplies; ///< Used when nameservers are given explicitly.
        std::vector<Call> calls;

        DnsReply query(const std::string& question, uint16_t qtype, uint16_t qclass,
                       unsigned lifetime, const std::vector<std::string>& nameservers = {}) override
        {
            calls.push_back({ question, qtype, qclass, lifetime, nameservers });
            auto& table = nameservers.empty() ? replies : directReplies;
            auto it = table.find(Key(question, qtype));
            if (it == table.end()) {
                return failure(DnsReply::Outcome::NotFound);
            }
            return it->second;
        }

        /* Queries sent to the default nameservers */
        size_t count(const std::string& question, uint16_t qtype) const
        {
            size_t n = 0;
            for (auto& call: calls) {
                if (call.question == question && call.qtype == qtype && call.nameservers.empty()) {
                    n++;
                }
            }
            return n;
        }

        static DnsReply answer(const std::vector<DnsRecordSet>& answer, const std::vector<DnsRecordSet>& additional = {})
        {
            DnsReply reply;
            reply.response.answer = answer;
            reply.response.additional = additional;
            return reply;
        }

        static DnsReply failure(DnsReply::Outcome outcome)
        {
            DnsReply reply;
            reply.outcome = outcome;
            reply.error = outcomeToText(outcome);
            return reply;
        }
};

inline DnsRecordSet records(const std::string& name, uint16_t type, const std::vector<std::string>& values)
{
    return DnsRecordSet{ name, type, ns_c_in, values };
}

/* Temporary directory removed with its files at the end of the test */
class TempDir {
    private:
        std::string m_path;
        std::vector<std::string> m_files;

    public:
        TempDir()
        {
            char tmpl[] = "/tmp/dnscombine-test-XXXXXX";
            if (::mkdtemp(tmpl) == nullptr) {
                throw std::runtime_error("failed to create temporary directory");
            }
            m_path = tmpl;
        }

        ~TempDir()
        {
            for (auto& file: m_files) {
                ::unlink(file.c_str());
            }
            ::rmdir(m_path.c_str());
        }

        std::string file(const std::string& name)
        {
            auto path = m_path + "/" + name;
            m_files.push_back(path);
            return path;
        }

        std::string write(const std::string& name, const std::string& content)
        {
            auto path = file(name);
            auto f = fopen(path.c_str(), "w");
            if (f == nullptr) {
                throw std::runtime_error("failed to create " + path);
            }
            fwrite(content.data(), 1, content.size(), f);
            fclose(f);
            return path;
        }
};

/* Collects log messages at or above a level while in scope */
class LogCapture {
    private:
        char* m_buffer = nullptr;
        size_t m_size = 0;
        FILE* m_out;
        Log::Level m_savedLevel;

    public:
        explicit LogCapture(Log::Level lvl)
            : m_out(::open_memstream(&m_buffer, &m_size))
            , m_savedLevel(Log::getLogLevel())
        {
            if (m_out == nullptr) {
                throw std::runtime_error("failed to open memory stream");
            }
            Log::setOutput(m_out);
            Log::setLogLevel(lvl);
        }

        ~LogCapture()
        {
            Log::setOutput(nullptr);
            Log::setLogLevel(m_savedLevel);
            fclose(m_out);
            free(m_buffer);
        }

        LogCapture(const LogCapture&) = delete;
        LogCapture& operator=(const LogCapture&) = delete;

        std::string text()
        {
            fflush(m_out);
            return std::string(m_buffer, m_size);
        }

        bool contains(const std::string& what)
        {
            return text().find(what) != std::string::npos;
        }
};
