#pragma once
#include <array>
#include <optional>
#include <string>

enum class ToolKind {
    ListFiles,
    ReadFile,
    FindFile,
    OpenWorkspaceForFile,
    CreateFile,
    ReplaceLines,
    TypeIntoFile,
    ExecuteShellCommand,
    ShellListDir
};

enum class ToolGroup { File, Edit, Shell };

constexpr std::array<ToolKind, 9> ALL_TOOL_KINDS = {
    ToolKind::ListFiles,
    ToolKind::ReadFile,
    ToolKind::FindFile,
    ToolKind::OpenWorkspaceForFile,
    ToolKind::CreateFile,
    ToolKind::ReplaceLines,
    ToolKind::TypeIntoFile,
    ToolKind::ExecuteShellCommand,
    ToolKind::ShellListDir
};

/** @brief 对外暴露的工具名 */
inline const char* toolKindName(ToolKind kind) {
    switch (kind) {
        case ToolKind::ListFiles: return "list_files_code";
        case ToolKind::ReadFile: return "read_file_code";
        case ToolKind::FindFile: return "find_file_code";
        case ToolKind::OpenWorkspaceForFile: return "open_workspace_for_file";
        case ToolKind::CreateFile: return "create_file_code";
        case ToolKind::ReplaceLines: return "replace_lines_code";
        case ToolKind::TypeIntoFile: return "type_into_file_code";
        case ToolKind::ExecuteShellCommand: return "execute_shell_command_code";
        case ToolKind::ShellListDir: return "shell_list_dir_code";
    }
    return "";
}

inline ToolGroup toolGroupOf(ToolKind kind) {
    switch (kind) {
        case ToolKind::ListFiles:
        case ToolKind::ReadFile:
        case ToolKind::FindFile:
        case ToolKind::OpenWorkspaceForFile:
            return ToolGroup::File;
        case ToolKind::CreateFile:
        case ToolKind::ReplaceLines:
        case ToolKind::TypeIntoFile:
            return ToolGroup::Edit;
        case ToolKind::ExecuteShellCommand:
        case ToolKind::ShellListDir:
            return ToolGroup::Shell;
    }
    return ToolGroup::File;
}

inline std::optional<ToolKind> toolKindFromName(const std::string& name) {
    for (ToolKind kind : ALL_TOOL_KINDS) {
        if (name == toolKindName(kind)) return kind;
    }
    return std::nullopt;
}
