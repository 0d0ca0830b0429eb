#include "pch.h"
#include <envmgr/registry/win32_accessor.h>

namespace envmgr
{

    namespace
    {
        constexpr DWORD BROADCAST_TIMEOUT_MS = 5000;

        /// Owns an open HKEY.
        class ScopedKey
        {
            PNQ_DECLARE_NON_COPYABLE(ScopedKey)

        public:
            ScopedKey() = default;
            ~ScopedKey()
            {
                if (m_hkey)
                    RegCloseKey(m_hkey);
            }

            HKEY* out() { return &m_hkey; }
            HKEY get() const { return m_hkey; }

        private:
            HKEY m_hkey = nullptr;
        };

        // Open the environment registry key of a scope
        LONG open_env_key(Scope scope, REGSAM access, ScopedKey& key)
        {
            HKEY root = (scope == Scope::User) ? HKEY_CURRENT_USER : HKEY_LOCAL_MACHINE;
            const wchar_t* subkey = (scope == Scope::User)
                                        ? L"Environment"
                                        : L"SYSTEM\\CurrentControlSet\\Control\\Session Manager\\Environment";

            return RegOpenKeyExW(root, subkey, 0, access, key.out());
        }

        Error win_error(LONG result, std::string message, Scope scope, std::string_view name)
        {
            ErrorCode code = ErrorCode::IoError;
            switch (result)
            {
            case ERROR_ACCESS_DENIED:
                code = ErrorCode::AccessDenied;
                break;
            case ERROR_INVALID_PARAMETER:
                code = ErrorCode::InvalidName;
                break;
            case ERROR_FILE_NOT_FOUND:
                code = ErrorCode::NotFound;
                break;
            }

            Error error{code, std::format("{} (error {})", message, result)};
            error.scope = scope;
            error.name = std::string{name};
            return error;
        }
    } // anonymous namespace

    Result<VariableSet> Win32RegistryAccessor::read(Scope scope) const
    {
        ScopedKey key;
        LONG result = open_env_key(scope, KEY_READ, key);
        if (result != ERROR_SUCCESS)
        {
            PNQ_LOG_WIN_ERROR(result, "Failed to open environment key for reading");
            return std::unexpected(win_error(result, "Cannot open environment key", scope, {}));
        }

        DWORD max_name_len = 0;
        DWORD max_data_len = 0;
        result = RegQueryInfoKeyW(key.get(), nullptr, nullptr, nullptr, nullptr, nullptr, nullptr,
                                  nullptr, &max_name_len, &max_data_len, nullptr, nullptr);
        if (result != ERROR_SUCCESS)
        {
            PNQ_LOG_WIN_ERROR(result, "RegQueryInfoKey failed");
            return std::unexpected(win_error(result, "Cannot query environment key", scope, {}));
        }

        VariableSet set{scope};
        std::vector<wchar_t> name_buffer(max_name_len + 1);
        std::vector<wchar_t> data_buffer(max_data_len / sizeof(wchar_t) + 2);

        for (DWORD index = 0;; ++index)
        {
            DWORD name_len = static_cast<DWORD>(name_buffer.size());
            DWORD data_len = static_cast<DWORD>(data_buffer.size() * sizeof(wchar_t));
            DWORD type = 0;

            result = RegEnumValueW(key.get(), index, name_buffer.data(), &name_len, nullptr, &type,
                                   reinterpret_cast<LPBYTE>(data_buffer.data()), &data_len);
            if (result == ERROR_NO_MORE_ITEMS)
                break;

            if (result == ERROR_MORE_DATA)
            {
                // Value grew between RegQueryInfoKey and now
                name_buffer.resize(name_buffer.size() * 2);
                data_buffer.resize(data_len / sizeof(wchar_t) + 2);
                --index;
                continue;
            }

            if (result != ERROR_SUCCESS)
            {
                PNQ_LOG_WIN_ERROR(result, "RegEnumValue failed");
                return std::unexpected(win_error(result, "Cannot enumerate environment key", scope, {}));
            }

            const std::string name = pnq::string::encode_as_utf8(std::wstring_view{name_buffer.data(), name_len});
            if (type != REG_SZ && type != REG_EXPAND_SZ)
            {
                spdlog::debug("Skipping non-string environment value {} (type {})", name, type);
                continue;
            }

            // Registry data may or may not be NUL terminated
            size_t chars = data_len / sizeof(wchar_t);
            while (chars > 0 && data_buffer[chars - 1] == L'\0')
                --chars;

            Variable variable;
            variable.scope = scope;
            variable.name = name;
            variable.value = pnq::string::encode_as_utf8(std::wstring_view{data_buffer.data(), chars});
            variable.type = (type == REG_EXPAND_SZ) ? ValueType::ExpandString : ValueType::String;
            set.upsert(std::move(variable));
        }

        spdlog::debug("Read {} variables from {} scope", set.size(), scope_to_string(scope));
        return set;
    }

    bool Win32RegistryAccessor::has_write_access(Scope scope) const
    {
        ScopedKey key;
        return open_env_key(scope, KEY_SET_VALUE, key) == ERROR_SUCCESS;
    }

    Result<void> Win32RegistryAccessor::do_write(const Variable& variable)
    {
        ScopedKey key;
        LONG result = open_env_key(variable.scope, KEY_SET_VALUE, key);
        if (result != ERROR_SUCCESS)
        {
            PNQ_LOG_WIN_ERROR(result, "Failed to open environment key for writing");
            return std::unexpected(win_error(result, "Cannot open environment key for writing", variable.scope, variable.name));
        }

        const std::wstring wide_name = pnq::string::encode_as_utf16(variable.name);
        const std::wstring wide_value = pnq::string::encode_as_utf16(variable.value);
        const DWORD type = (variable.type == ValueType::ExpandString) ? REG_EXPAND_SZ : REG_SZ;
        const DWORD size = static_cast<DWORD>((wide_value.size() + 1) * sizeof(wchar_t));

        result = RegSetValueExW(key.get(), wide_name.c_str(), 0, type,
                                reinterpret_cast<const BYTE*>(wide_value.c_str()), size);
        if (result != ERROR_SUCCESS)
        {
            PNQ_LOG_WIN_ERROR(result, "Failed to write environment variable");
            return std::unexpected(win_error(result, "Cannot write variable", variable.scope, variable.name));
        }

        spdlog::info("Wrote {}\\{}", scope_to_string(variable.scope), variable.name);
        return {};
    }

    Result<void> Win32RegistryAccessor::do_remove(Scope scope, std::string_view name)
    {
        ScopedKey key;
        LONG result = open_env_key(scope, KEY_SET_VALUE, key);
        if (result != ERROR_SUCCESS)
        {
            PNQ_LOG_WIN_ERROR(result, "Failed to open environment key for writing");
            return std::unexpected(win_error(result, "Cannot open environment key for writing", scope, name));
        }

        const std::wstring wide_name = pnq::string::encode_as_utf16(name);
        result = RegDeleteValueW(key.get(), wide_name.c_str());
        if (result == ERROR_FILE_NOT_FOUND)
            return std::unexpected(win_error(result, "Variable does not exist", scope, name));

        if (result != ERROR_SUCCESS)
        {
            PNQ_LOG_WIN_ERROR(result, "Failed to delete environment variable");
            return std::unexpected(win_error(result, "Cannot delete variable", scope, name));
        }

        spdlog::info("Deleted {}\\{}", scope_to_string(scope), name);
        return {};
    }

    bool Win32RegistryAccessor::do_broadcast()
    {
        // WM_SETTINGCHANGE with "Environment" tells Explorer and other apps to reload
        DWORD_PTR result = 0;
        const LRESULT sent = SendMessageTimeoutW(
            HWND_BROADCAST,
            WM_SETTINGCHANGE,
            0,
            reinterpret_cast<LPARAM>(L"Environment"),
            SMTO_ABORTIFHUNG,
            BROADCAST_TIMEOUT_MS,
            &result);

        if (!sent)
        {
            PNQ_LOG_LAST_ERROR("SendMessageTimeout(WM_SETTINGCHANGE) failed");
            return false;
        }
        return true;
    }

} // namespace envmgr
