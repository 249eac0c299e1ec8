// =================================================================
// src/Addonkit/ProjectGenerator.cpp
// =================================================================
// Implementation for scaffold generation.

#include "Addonkit/ProjectGenerator.hpp"
#include "Addonkit/Logger.hpp"
#include "Addonkit/TemplateRenderer.hpp"
#include "Addonkit/Version.hpp"
#include "nlohmann/json.hpp"
#include <cctype>

namespace Addonkit {

namespace {

const char* kCMakeListsTemplate = R"(
    cmake_minimum_required(VERSION @cmake_version)
    project(@name)

    set(CMAKE_C_STANDARD 99)

    add_library(${PROJECT_NAME} SHARED "src/module.c")
    set_target_properties(${PROJECT_NAME} PROPERTIES PREFIX "" SUFFIX ".node")

    # BEGIN N-API specific
    include_directories(@include_dir)
    if(WIN32)
        find_library(NODE_LIB node @lib_dir)
        target_link_libraries(${PROJECT_NAME} ${NODE_LIB})
    endif()
    add_definitions(-DNAPI_VERSION=@napi_version)
    # END N-API specific
)";

const char* kSourceTemplate = R"(
    #include <stdlib.h>
    #include <node_api.h>
    #include <assert.h>

    napi_value Init(napi_env env, napi_value exports) {
        napi_value str;
        napi_status status = napi_create_string_utf8(env, "A project named @name is growing here.", NAPI_AUTO_LENGTH, &str);
        assert(status == napi_ok);
        return str;
    }

    NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)
)";

const char* kIgnoreTemplate = R"(
    .vscode
    @build_dir
    node-v*
    @lib_dir
)";

} // namespace

ProjectGenerator::ProjectGenerator(const ProjectLayout& layout, const RuntimeRelease& release, int napi_version)
    : m_layout(layout), m_release(release), m_napi_version(napi_version) {}

void ProjectGenerator::generate(const std::string& name, const std::string& cmake_version) const {
    m_sys.createDirectories(m_layout.srcDir());
    m_sys.writeFile(m_layout.cmakeFile(), cmakeListsContent(name, cmake_version));
    m_sys.writeFile(m_layout.sourceFile(), sourceContent(name));
    m_sys.writeFile(m_layout.manifestFile(), manifestContent(name));
    LOG_INFO("Generate", "Wrote CMakeLists.txt, src/module.c and package.json");
}

void ProjectGenerator::writeIgnoreFile() const {
    m_sys.writeFile(m_layout.ignoreFile(), ignoreContent());
    LOG_DEBUG("Generate", "Wrote .gitignore");
}

std::string ProjectGenerator::cmakeListsContent(const std::string& name, const std::string& cmake_version) const {
    return TemplateRenderer::render(kCMakeListsTemplate, {
        {"cmake_version", cmake_version},
        {"name", name},
        {"include_dir", relativeToRoot(m_layout.includeDir(m_release))},
        {"lib_dir", relativeToRoot(m_layout.libDir())},
        {"napi_version", std::to_string(m_napi_version)},
    });
}

std::string ProjectGenerator::sourceContent(const std::string& name) const {
    return TemplateRenderer::render(kSourceTemplate, {{"name", name}});
}

std::string ProjectGenerator::manifestContent(const std::string& name) const {
    const std::string tool = kToolName;

    nlohmann::ordered_json manifest;
    manifest["name"] = name;
    manifest["version"] = "0.0.0";
    manifest["main"] = relativeToRoot(m_layout.artifact(name));
    manifest["scripts"] = {
        {"install", tool + " init"},
        {"build", tool + " build"},
        {"test", tool + " test"},
        {"clean", tool + " clean"},
    };
    manifest["devDependencies"] = {
        {tool, std::string("^") + kToolVersion},
    };

    return TemplateRenderer::toNativeLineEndings(manifest.dump(4));
}

std::string ProjectGenerator::ignoreContent() const {
    return TemplateRenderer::render(kIgnoreTemplate, {
        {"build_dir", relativeToRoot(m_layout.buildDir())},
        {"lib_dir", relativeToRoot(m_layout.libDir())},
    });
}

bool ProjectGenerator::isValidName(const std::string& name) {
    if (name.empty() || name[0] == '.' || name[0] == '-') {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::string ProjectGenerator::relativeToRoot(const std::filesystem::path& path) const {
    return path.lexically_relative(m_layout.root()).generic_string();
}

} // namespace Addonkit
