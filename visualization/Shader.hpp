#pragma once

#include <GL/glew.h>
#include <string>

namespace visualization
{

// Owns one linked GL program. Must be released while its context is current.
class Shader
{
public:
    Shader() = default;
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    bool load(const std::string& vertexPath, const std::string& fragmentPath);
    void release();
    void use() const;
    GLuint id() const noexcept;
    GLint uniformLocation(const std::string& name) const;

private:
    GLuint m_program = 0;

    static std::string loadSource(const std::string& path);
    static bool compileShader(GLuint shader, const std::string& source, const std::string& path);
};

} // namespace visualization
