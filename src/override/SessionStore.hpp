#pragma once

#include "OverrideTypes.hpp"

#include <optional>

namespace Override {
    class ISessionStore {
      protected:
        ISessionStore() = default;

      public:
        virtual ~ISessionStore() = default;

        virtual const std::optional<SSessionRecord>& get() const               = 0;
        virtual void                                 set(SSessionRecord record) = 0;
        virtual void                                 clear()                    = 0;
    };

    class CMemorySessionStore : public ISessionStore {
      public:
        CMemorySessionStore()          = default;
        virtual ~CMemorySessionStore() = default;

        virtual const std::optional<SSessionRecord>& get() const;
        virtual void                                 set(SSessionRecord record);
        virtual void                                 clear();

      private:
        std::optional<SSessionRecord> m_record;
    };
};
