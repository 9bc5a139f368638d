/// @file Thread.cpp
/// @brief Platform side of Tether::Execution::Thread.

#include <Tether/Execution/ExecutionContext.hpp>
#include <Tether/Execution/Thread.hpp>
#include <Tether/Locals/LocalStore.hpp>

#include <algorithm>
#include <cstring>
#include <exception>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <process.h>
#else
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#endif
#endif

namespace Tether::Execution
{
    /// Handed to the new thread, which owns and frees it.
    struct Thread::Launch final
    {
        Entry                                 entry {};
        ThreadName                            name {};
        Memory::Scoped<Locals::LocalStore>    inherited {};
        Memory::Shared<std::atomic<ThreadId>> id {};
    };

    Thread::Thread(Thread&& other) noexcept
    {
        MoveFrom_(other);
    }

    Thread& Thread::operator=(Thread&& other) noexcept
    {
        if (this != &other)
        {
            HandleDestruction_();
            MoveFrom_(other);
        }
        return *this;
    }

    void Thread::Start(Entry entry, Options options)
    {
        if (IsJoinable() || !entry)
            std::terminate();

        auto launch   = Memory::MakeScoped<Launch>();
        launch->entry = std::move(entry);
        launch->name  = options.name;
        launch->id    = Memory::MakeShared<std::atomic<ThreadId>>(ThreadId {0});
        if (options.inheritLocals)
            launch->inherited = ExecutionContext::Current().SnapshotInheritable();

        // From here on the child may free `launch` at any time.
        auto id = launch->id;

#if defined(_WIN32)
        unsigned   osId   = 0;
        const auto handle = ::_beginthreadex(nullptr, static_cast<unsigned>(options.stackSize), &Trampoline_,
                                             launch.Get(), 0u, &osId);
        if (handle == 0)
            std::terminate();
        (void) launch.Release();
        m_handle = reinterpret_cast<NativeHandle>(handle);
        id->store(static_cast<ThreadId>(osId), std::memory_order_release);
#else
        pthread_attr_t attributes {};
        (void) ::pthread_attr_init(&attributes);
        if (options.stackSize != 0)
            (void) ::pthread_attr_setstacksize(&attributes, options.stackSize);
        const int rc = ::pthread_create(&m_handle, &attributes, &Trampoline_, launch.Get());
        (void) ::pthread_attr_destroy(&attributes);
        if (rc != 0)
            std::terminate();
        (void) launch.Release();
#endif

        m_options  = options;
        m_id       = std::move(id);
        m_joinable = true;
    }

    void Thread::Join() noexcept
    {
        if (!m_joinable)
            return;
#if defined(_WIN32)
        (void) ::WaitForSingleObject(m_handle, INFINITE);
        (void) ::CloseHandle(m_handle);
#else
        (void) ::pthread_join(m_handle, nullptr);
#endif
        Forget_();
    }

    void Thread::Detach() noexcept
    {
        if (!m_joinable)
            return;
#if defined(_WIN32)
        (void) ::CloseHandle(m_handle);
#else
        (void) ::pthread_detach(m_handle);
#endif
        Forget_();
    }

    Thread::ThreadId Thread::CurrentId() noexcept
    {
#if defined(_WIN32)
        return static_cast<ThreadId>(::GetCurrentThreadId());
#elif defined(__linux__)
        return static_cast<ThreadId>(::syscall(SYS_gettid));
#elif defined(__APPLE__)
        ThreadId id = 0;
        (void) ::pthread_threadid_np(nullptr, &id);
        return id;
#else
        const pthread_t self = ::pthread_self();
        ThreadId        id   = 0;
        std::memcpy(&id, &self, std::min(sizeof(id), sizeof(self)));
        return id;
#endif
    }

    bool Thread::SetCurrentName(std::string_view name) noexcept
    {
        if (name.empty())
            return false;

        const auto length = std::min<std::size_t>(name.size(), ThreadName::MaxBytes);
#if defined(_WIN32)
        wchar_t    wide[ThreadName::MaxBytes + 1] {};
        const int  count = ::MultiByteToWideChar(CP_UTF8, 0, name.data(), static_cast<int>(length), wide,
                                                 static_cast<int>(ThreadName::MaxBytes));
        return count > 0 && SUCCEEDED(::SetThreadDescription(::GetCurrentThread(), wide));
#else
        char buffer[ThreadName::MaxBytes + 1] {};
#if defined(__linux__)
        std::memcpy(buffer, name.data(), std::min<std::size_t>(length, 15));
        return ::pthread_setname_np(::pthread_self(), buffer) == 0;
#elif defined(__APPLE__)
        std::memcpy(buffer, name.data(), length);
        return ::pthread_setname_np(buffer) == 0;
#else
        return false;
#endif
#endif
    }

    UInt32 Thread::HardwareConcurrency() noexcept
    {
#if defined(_WIN32)
        const DWORD count = ::GetActiveProcessorCount(ALL_PROCESSOR_GROUPS);
#else
        const long count = ::sysconf(_SC_NPROCESSORS_ONLN);
#endif
        return count > 0 ? static_cast<UInt32>(count) : 1u;
    }

#if defined(_WIN32)
    unsigned __stdcall Thread::Trampoline_(void* launch) noexcept
    {
        Run_(static_cast<Launch*>(launch));
        return 0;
    }
#else
    void* Thread::Trampoline_(void* launch) noexcept
    {
        Run_(static_cast<Launch*>(launch));
        return nullptr;
    }
#endif

    void Thread::Run_(Launch* raw) noexcept
    {
        Memory::Scoped<Launch> launch(raw);
        launch->id->store(CurrentId(), std::memory_order_release);
        if (!launch->name.Empty())
            (void) SetCurrentName(launch->name.View());
        if (launch->inherited)
            ExecutionContext::Current().AdoptInheritable(std::move(launch->inherited));

        // An exception escaping the entry terminates here.
        launch->entry();
    }

    void Thread::Forget_() noexcept
    {
        m_joinable = false;
        m_handle   = NativeHandle {};
        m_id.Reset();
    }

    void Thread::MoveFrom_(Thread& other) noexcept
    {
        m_options  = std::exchange(other.m_options, Options {});
        m_joinable = std::exchange(other.m_joinable, false);
        m_handle   = std::exchange(other.m_handle, NativeHandle {});
        m_id       = std::move(other.m_id);
    }

    void Thread::HandleDestruction_() noexcept
    {
        if (!m_joinable)
            return;

        switch (m_options.onDestruct)
        {
            case OnDestruct::Join: Join(); return;
            case OnDestruct::Detach: Detach(); return;
            default: std::terminate();
        }
    }
}// namespace Tether::Execution
