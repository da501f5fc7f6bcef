#include "visualization/Shader.hpp"

#include "logging/Logger.hpp"

#include <GL/glew.h>
#include <cstddef>
#include <fstream>
#include <sstream>

namespace visualization
{

Shader::~Shader()
{
    release();
}

bool Shader::load(const std::string& vertexPath, const std::string& fragmentPath)
{
    release();

    const std::string vertexSource = loadSource(vertexPath);
    const std::string fragmentSource = loadSource(fragmentPath);
    if (vertexSource.empty() || fragmentSource.empty())
    {
        return false;
    }

    const GLuint vertexShader = glCreateShader(GL_VERTEX_SHADER);
    const GLuint fragmentShader = glCreateShader(GL_FRAGMENT_SHADER);
    if (!compileShader(vertexShader, vertexSource, vertexPath) ||
        !compileShader(fragmentShader, fragmentSource, fragmentPath))
    {
        glDeleteShader(vertexShader);
        glDeleteShader(fragmentShader);
        return false;
    }

    m_program = glCreateProgram();
    glAttachShader(m_program, vertexShader);
    glAttachShader(m_program, fragmentShader);
    glLinkProgram(m_program);
    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);

    GLint linkStatus = GL_FALSE;
    glGetProgramiv(m_program, GL_LINK_STATUS, &linkStatus);
    if (linkStatus != GL_TRUE)
    {
        GLint logLength = 0;
        glGetProgramiv(m_program, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<std::size_t>(logLength > 0 ? logLength : 1), '\0');
        glGetProgramInfoLog(m_program, logLength, nullptr, log.data());
        globe::Logger::log(globe::Logger::Level::Error,
                           "Shader link error (" + vertexPath + ", " + fragmentPath + "): " + log);
        glDeleteProgram(m_program);
        m_program = 0;
        return false;
    }

    return true;
}

void Shader::release()
{
    if (m_program != 0)
    {
        glDeleteProgram(m_program);
        m_program = 0;
    }
}

void Shader::use() const
{
    if (m_program != 0)
    {
        glUseProgram(m_program);
    }
}

GLuint Shader::id() const noexcept
{
    return m_program;
}

GLint Shader::uniformLocation(const std::string& name) const
{
    return glGetUniformLocation(m_program, name.c_str());
}

std::string Shader::loadSource(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
    {
        globe::Logger::log(globe::Logger::Level::Error, "Unable to open shader file: " + path);
        return {};
    }

    std::ostringstream source;
    source << file.rdbuf();
    return source.str();
}

bool Shader::compileShader(GLuint shader, const std::string& source, const std::string& path)
{
    const char* sourceCStr = source.c_str();
    glShaderSource(shader, 1, &sourceCStr, nullptr);
    glCompileShader(shader);

    GLint compileStatus = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compileStatus);
    if (compileStatus != GL_TRUE)
    {
        GLint logLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<std::size_t>(logLength > 0 ? logLength : 1), '\0');
        glGetShaderInfoLog(shader, logLength, nullptr, log.data());
        globe::Logger::log(globe::Logger::Level::Error, "Shader compile error in " + path + ": " + log);
        return false;
    }

    return true;
}

} // namespace visualization
